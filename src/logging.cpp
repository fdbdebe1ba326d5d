#include "logging.hpp"
#include <cstdarg>
#include <cstdio>
#include <vector>

namespace skipgram {

Logger& Logger::Instance() {
    static Logger logger;
    return logger;
}

void Logger::Open(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) file_.close();
    if (path.empty()) return;

    file_.open(path, std::ios::app);
    if (!file_) {
        std::cerr << "Warning: cannot open log file " << path << "\n";
    }
}

void Logger::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) file_.close();
}

void Logger::Write(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << line << "\n";
    if (file_.is_open()) {
        file_ << line << "\n";
        file_.flush();
    }
}

std::string StringPrintf(const char* format, ...) {
    va_list args;
    va_start(args, format);
    va_list args_copy;
    va_copy(args_copy, args);
    int size = std::vsnprintf(nullptr, 0, format, args_copy);
    va_end(args_copy);

    std::string result;
    if (size > 0) {
        std::vector<char> buffer(size + 1);
        std::vsnprintf(buffer.data(), buffer.size(), format, args);
        result.assign(buffer.data(), size);
    }
    va_end(args);
    return result;
}

} // namespace skipgram

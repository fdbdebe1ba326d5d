#pragma once

#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace skipgram {

// 日志：同时写到 stdout 和（可选的）追加模式日志文件
class Logger {
public:
    static Logger& Instance();

    // 打开日志文件，path 为空则只输出到 stdout
    void Open(const std::string& path);
    void Close();

    void Write(const std::string& line);

private:
    Logger() = default;

    std::mutex mutex_;
    std::ofstream file_;
};

// 一行日志，析构时输出
class LogLine {
public:
    LogLine() = default;
    ~LogLine() { Logger::Instance().Write(stream_.str()); }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
};

inline LogLine Log() { return LogLine(); }

// printf 风格格式化
std::string StringPrintf(const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;

} // namespace skipgram

#include "vocabulary.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace skipgram {

std::vector<std::string> ReadCorpus(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw ConfigError("Cannot open training file: " + filename);
    }

    std::vector<std::string> tokens;
    std::string word;
    while (file >> word) {
        std::transform(word.begin(), word.end(), word.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        tokens.push_back(word);
    }

    if (tokens.empty()) {
        throw ConfigError("Training file is empty: " + filename);
    }
    return tokens;
}

std::vector<std::string> Vocabulary::LearnFromFile(const std::string& filename, int min_count) {
    Log() << "Learning vocabulary from " << filename << "...";

    std::vector<std::string> tokens = ReadCorpus(filename);
    LearnFromTokens(tokens, min_count);

    Log() << "Vocab size: " << vocab_.size() - 1 << " + " << kUnknownWord;
    Log() << "Words per epoch: " << train_words_;
    return tokens;
}

void Vocabulary::LearnFromTokens(const std::vector<std::string>& tokens, int min_count) {
    if (tokens.empty()) {
        throw ConfigError("Corpus is empty");
    }

    // 统计词频，counted 保持首次出现的顺序
    std::vector<VocabWord> counted;
    std::unordered_map<std::string, int> index;
    counted.emplace_back(kUnknownWord, 0);
    index[kUnknownWord] = 0;

    for (const auto& word : tokens) {
        if (word.empty()) continue;

        auto it = index.find(word);
        if (it == index.end()) {
            index[word] = counted.size();
            counted.emplace_back(word, 1);
        } else {
            counted[it->second].count++;
        }
    }

    SortAndFilter(std::move(counted), min_count);
}

void Vocabulary::SortAndFilter(std::vector<VocabWord> counted, int min_count) {
    // 按词频降序排序（UNK 保持在第一位，同频按首次出现顺序）
    std::stable_sort(counted.begin() + 1, counted.end(),
                     [](const VocabWord& a, const VocabWord& b) {
                         return a.count > b.count;
                     });

    vocab_.clear();
    word_to_index_.clear();
    vocab_.push_back(std::move(counted[0]));
    word_to_index_[kUnknownWord] = kUnknownId;

    // 低频词并入 UNK
    for (size_t i = 1; i < counted.size(); ++i) {
        if (counted[i].count >= min_count) {
            word_to_index_[counted[i].word] = vocab_.size();
            vocab_.push_back(std::move(counted[i]));
        } else {
            vocab_[kUnknownId].count += counted[i].count;
        }
    }

    if (vocab_.size() < 2) {
        throw VocabularyError("No word occurs at least min_count=" +
                              std::to_string(min_count) + " times");
    }

    train_words_ = 0;
    for (const auto& word : vocab_) {
        train_words_ += word.count;
    }
}

int Vocabulary::GetWordIndex(const std::string& word) const {
    auto it = word_to_index_.find(word);
    return it != word_to_index_.end() ? it->second : -1;
}

int Vocabulary::Lookup(const std::string& word) const {
    int index = GetWordIndex(word);
    return index >= 0 ? index : kUnknownId;
}

std::vector<int> Vocabulary::Encode(const std::vector<std::string>& tokens) const {
    std::vector<int> ids;
    ids.reserve(tokens.size());
    for (const auto& token : tokens) {
        ids.push_back(Lookup(token));
    }
    return ids;
}

void Vocabulary::Save(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file) {
        throw ConfigError("Cannot write vocabulary file: " + filename);
    }
    for (const auto& word : vocab_) {
        file << word.word << " " << word.count << "\n";
    }
}

void Vocabulary::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw ConfigError("Cannot open vocabulary file: " + filename);
    }

    std::vector<VocabWord> loaded;
    std::unordered_map<std::string, int> index;
    std::string line;
    int line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty()) continue;

        std::istringstream iss(line);
        std::string word;
        long long count;
        if (!(iss >> word >> count) || count < 0 || index.count(word)) {
            throw ConfigError("Malformed vocabulary file " + filename +
                              " at line " + std::to_string(line_no));
        }
        index[word] = loaded.size();
        loaded.emplace_back(word, count);
    }

    if (loaded.size() < 2 || loaded[0].word != kUnknownWord) {
        throw ConfigError("Vocabulary file " + filename + " must start with " +
                          kUnknownWord + " and hold at least one word");
    }

    vocab_ = std::move(loaded);
    word_to_index_ = std::move(index);
    train_words_ = 0;
    for (const auto& word : vocab_) {
        train_words_ += word.count;
    }
}

} // namespace skipgram

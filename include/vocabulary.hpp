#pragma once

#include <string>
#include <vector>
#include <unordered_map>

namespace skipgram {

struct VocabWord {
    std::string word;
    long long count;

    VocabWord(const std::string& w = "", long long c = 0)
        : word(w), count(c) {}
};

class Vocabulary {
public:
    // 低频词/未登录词的占位符，固定 id 0
    static constexpr const char* kUnknownWord = "UNK";
    static constexpr int kUnknownId = 0;

    Vocabulary() = default;

    // 从训练文件学习词汇表，同时返回语料（小写后的 token 序列）
    std::vector<std::string> LearnFromFile(const std::string& filename, int min_count = 5);

    // 从内存中的 token 序列学习词汇表
    void LearnFromTokens(const std::vector<std::string>& tokens, int min_count = 5);

    // 保存/加载词汇表 ("word count" 每行一个，按 id 顺序)
    void Save(const std::string& filename) const;
    void Load(const std::string& filename);

    // 查询：不在词表中返回 -1
    int GetWordIndex(const std::string& word) const;
    // 查询：不在词表中返回 UNK
    int Lookup(const std::string& word) const;

    // token 序列 -> id 序列，未登录词映射为 UNK
    std::vector<int> Encode(const std::vector<std::string>& tokens) const;

    const VocabWord& GetWord(int index) const { return vocab_[index]; }
    size_t Size() const { return vocab_.size(); }
    // 每个 epoch 的词数 (所有计数之和)
    long long TotalWords() const { return train_words_; }

private:
    std::vector<VocabWord> vocab_;
    std::unordered_map<std::string, int> word_to_index_;
    long long train_words_ = 0;

    void SortAndFilter(std::vector<VocabWord> counted, int min_count);
};

// 读取语料文件：按空白切分并转为小写
std::vector<std::string> ReadCorpus(const std::string& filename);

} // namespace skipgram

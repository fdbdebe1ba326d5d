#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <vector>

namespace skipgram {

class Vocabulary;

// 一批 skip-gram 训练样本：examples[i] 是中心词，labels[i] 是上下文词
struct Batch {
    std::vector<int> examples;
    std::vector<int> labels;

    size_t Size() const { return examples.size(); }
};

// 从内存语料生成 (target, context) 样本流，可被多个线程并发拉取
class ExampleGenerator {
public:
    struct Config {
        int batch_size = 500;            // 每批样本数
        int window_size = 5;             // 左右各预测的词数
        float subsample = 1e-3f;         // 下采样阈值，0 表示关闭
        bool dynamic_window = true;      // 每个位置随机窗口 [1, window_size]
        uint64_t seed = 0x5eed;

        Config() = default;
    };

    // corpus 为 Vocabulary::Encode 得到的 id 序列
    ExampleGenerator(const Vocabulary& vocab, std::vector<int> corpus, const Config& config);

    // 拉取下一批样本（线程安全），可能跨越 epoch 边界
    Batch NextBatch();

    int CurrentEpoch() const { return current_epoch_.load(); }
    long long WordsPerEpoch() const { return static_cast<long long>(corpus_.size()); }
    long long TotalWordsProcessed() const { return total_words_processed_.load(); }

    // 词被下采样保留的概率
    float KeepProbability(int word_id) const;

private:
    const Vocabulary& vocab_;
    std::vector<int> corpus_;
    Config config_;

    std::mutex mutex_;
    std::mt19937_64 rng_;

    // 当前 epoch 下采样后保留的词及其在原语料中的位置
    std::vector<int> kept_;
    std::vector<size_t> kept_pos_;
    size_t raw_cursor_ = 0;              // 已计入 total_words_processed_ 的原语料位置

    size_t target_pos_ = 0;              // 当前中心词在 kept_ 中的位置
    int window_ = 0;                     // 当前中心词的窗口半径
    int offset_ = 0;                     // 当前窗口内的偏移

    std::atomic<int> current_epoch_{0};
    std::atomic<long long> total_words_processed_{0};

    void StartEpoch();
    void AdvanceTarget();
    void FinishEpoch();
};

} // namespace skipgram

#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace skipgram {

class Vocabulary;

// Skip-gram 负采样模型：输入/输出两个 [vocab_size x embedding_size] 矩阵
class EmbeddingModel {
public:
    struct Config {
        int embedding_size = 200;        // 向量维度
        int num_neg_samples = 25;        // 每个样本的负采样数量
        int unigram_table_size = 10000000; // 负采样表大小
        bool serialize_updates = false;  // true: 串行更新（用于可复现的测试）
        uint64_t seed = 0x5eed;          // 初始化随机种子

        Config() = default;
    };

    EmbeddingModel(const Vocabulary& vocab, const Config& config);

    // 一次负采样 SGD 更新：采样负例后调用 ApplyUpdate
    // 多线程同时调用时不加锁 (Hogwild)，重叠行的写入允许竞争
    void Update(int target_id, int context_id, float learning_rate, std::mt19937_64& rng);

    // 使用给定负例做一次梯度更新
    void ApplyUpdate(int target_id, int context_id, const std::vector<int>& negatives,
                     float learning_rate);

    // 按 count^0.75 分布采样负例，尽量排除 context_id
    std::vector<int> SampleNegatives(int context_id, std::mt19937_64& rng) const;

    // 全局步数：每处理一个样本加一
    long long GlobalStep() const { return global_step_.load(); }
    long long IncrementGlobalStep(long long n = 1) { return global_step_ += n; }

    // 保存/加载 checkpoint（两个矩阵 + 全局步数）
    void SaveCheckpoint(const std::string& filename) const;
    void LoadCheckpoint(const std::string& filename);

    int EmbeddingSize() const { return config_.embedding_size; }
    size_t VocabSize() const { return vocab_size_; }

    const std::vector<float>& InputEmbeddings() const { return w_in_; }
    const std::vector<float>& OutputEmbeddings() const { return w_out_; }
    // 测试和查询需要直接构造 embedding
    std::vector<float>& MutableInputEmbeddings() { return w_in_; }

private:
    const Vocabulary& vocab_;
    Config config_;
    size_t vocab_size_;

    // 网络权重
    std::vector<float> w_in_;      // 输入层 embedding
    std::vector<float> w_out_;     // Negative Sampling 权重

    // 负采样表
    std::vector<int> unigram_table_;

    // Sigmoid 查找表
    std::vector<float> exp_table_;

    std::atomic<long long> global_step_{0};
    std::mutex update_mutex_;

    void InitNet();
    void InitUnigramTable();
    void InitExpTable();
};

} // namespace skipgram

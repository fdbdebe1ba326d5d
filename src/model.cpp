#include "model.hpp"
#include "errors.hpp"
#include "vocabulary.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>

namespace skipgram {

namespace {

constexpr int EXP_TABLE_SIZE = 1000;
constexpr int MAX_EXP = 6;

constexpr char kCheckpointMagic[8] = {'S', 'G', 'N', 'S', 'C', 'K', 'P', 'T'};
constexpr uint32_t kCheckpointVersion = 1;

template <typename T>
void WritePod(std::ofstream& file, const T& value) {
    file.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
bool ReadPod(std::ifstream& file, T& value) {
    return static_cast<bool>(file.read(reinterpret_cast<char*>(&value), sizeof(T)));
}

} // namespace

EmbeddingModel::EmbeddingModel(const Vocabulary& vocab, const Config& config)
    : vocab_(vocab), config_(config), vocab_size_(vocab.Size()) {
    if (config_.embedding_size <= 0) {
        throw ConfigError("embedding_size must be positive");
    }
    if (config_.num_neg_samples < 0) {
        throw ConfigError("num_neg_samples must not be negative");
    }
    InitNet();
    InitExpTable();
    if (config_.num_neg_samples > 0) {
        InitUnigramTable();
    }
}

void EmbeddingModel::InitNet() {
    size_t layer_size = config_.embedding_size;
    std::mt19937_64 rng(config_.seed);

    // 输入层：均匀分布 [-0.5/dim, 0.5/dim]
    w_in_.resize(vocab_size_ * layer_size);
    std::uniform_real_distribution<float> dist(-0.5f / layer_size, 0.5f / layer_size);
    for (auto& val : w_in_) {
        val = dist(rng);
    }

    // 输出层初始化为 0
    w_out_.assign(vocab_size_ * layer_size, 0.0f);
}

void EmbeddingModel::InitExpTable() {
    exp_table_.resize(EXP_TABLE_SIZE);
    for (int i = 0; i < EXP_TABLE_SIZE; ++i) {
        float x = (i / static_cast<float>(EXP_TABLE_SIZE) * 2 - 1) * MAX_EXP;
        exp_table_[i] = std::exp(x) / (std::exp(x) + 1);
    }
}

void EmbeddingModel::InitUnigramTable() {
    const size_t table_size = std::max(1, config_.unigram_table_size);
    unigram_table_.resize(table_size);

    constexpr double POWER = 0.75;
    double total_pow = 0.0;
    for (size_t i = 0; i < vocab_size_; ++i) {
        total_pow += std::pow(vocab_.GetWord(i).count, POWER);
    }

    size_t word_idx = 0;
    double cumulative_prob = std::pow(vocab_.GetWord(word_idx).count, POWER) / total_pow;

    // 每个槽位取其中点所在的词，计数为 0 的词 (如空的 UNK) 不占槽位
    for (size_t i = 0; i < table_size; ++i) {
        while (word_idx + 1 < vocab_size_ &&
               (i + 0.5) / static_cast<double>(table_size) > cumulative_prob) {
            word_idx++;
            cumulative_prob += std::pow(vocab_.GetWord(word_idx).count, POWER) / total_pow;
        }
        unigram_table_[i] = static_cast<int>(word_idx);
    }
}

std::vector<int> EmbeddingModel::SampleNegatives(int context_id, std::mt19937_64& rng) const {
    std::vector<int> negatives;
    if (config_.num_neg_samples <= 0) return negatives;
    negatives.reserve(config_.num_neg_samples);

    std::uniform_int_distribution<size_t> table_dist(0, unigram_table_.size() - 1);
    for (int d = 0; d < config_.num_neg_samples; ++d) {
        int sample = unigram_table_[table_dist(rng)];
        // 与真实上下文相同的负例丢弃
        if (sample == context_id) continue;
        negatives.push_back(sample);
    }
    return negatives;
}

void EmbeddingModel::Update(int target_id, int context_id, float learning_rate,
                            std::mt19937_64& rng) {
    std::vector<int> negatives = SampleNegatives(context_id, rng);
    if (config_.serialize_updates) {
        std::lock_guard<std::mutex> lock(update_mutex_);
        ApplyUpdate(target_id, context_id, negatives, learning_rate);
    } else {
        ApplyUpdate(target_id, context_id, negatives, learning_rate);
    }
}

void EmbeddingModel::ApplyUpdate(int target_id, int context_id,
                                 const std::vector<int>& negatives, float learning_rate) {
    // =========================================================================
    // 负采样梯度：
    //   正例 (target, context) 标签 1，负例标签 0
    //   g = (label - σ(w_in[target]·w_out[ctx])) × lr
    //   w_out[ctx] += g × w_in[target]
    //   w_in[target] += Σ g × w_out[ctx]
    // =========================================================================
    const int layer_size = config_.embedding_size;
    const size_t input_offset = static_cast<size_t>(target_id) * layer_size;

    std::vector<float> neu1e(layer_size, 0.0f);

    for (size_t d = 0; d <= negatives.size(); ++d) {
        int target, label;
        if (d == 0) {
            target = context_id;
            label = 1;
        } else {
            target = negatives[d - 1];
            label = 0;
        }

        const size_t target_offset = static_cast<size_t>(target) * layer_size;

        float f = 0.0f;
        for (int c = 0; c < layer_size; ++c) {
            f += w_in_[input_offset + c] * w_out_[target_offset + c];
        }

        float g;
        if (f > MAX_EXP) {
            g = (label - 1) * learning_rate;
        } else if (f < -MAX_EXP) {
            g = (label - 0) * learning_rate;
        } else {
            int table_idx = static_cast<int>((f + MAX_EXP) * (EXP_TABLE_SIZE / MAX_EXP / 2));
            g = (label - exp_table_[table_idx]) * learning_rate;
        }

        for (int c = 0; c < layer_size; ++c) {
            neu1e[c] += g * w_out_[target_offset + c];
        }
        for (int c = 0; c < layer_size; ++c) {
            w_out_[target_offset + c] += g * w_in_[input_offset + c];
        }
    }

    for (int c = 0; c < layer_size; ++c) {
        w_in_[input_offset + c] += neu1e[c];
    }
}

void EmbeddingModel::SaveCheckpoint(const std::string& filename) const {
    std::ofstream file(filename, std::ios::binary);
    if (!file) {
        throw ConfigError("Cannot write checkpoint: " + filename);
    }

    file.write(kCheckpointMagic, sizeof(kCheckpointMagic));
    WritePod(file, kCheckpointVersion);
    WritePod(file, static_cast<uint64_t>(vocab_size_));
    WritePod(file, static_cast<uint32_t>(config_.embedding_size));
    WritePod(file, static_cast<int64_t>(global_step_.load()));
    file.write(reinterpret_cast<const char*>(w_in_.data()), w_in_.size() * sizeof(float));
    file.write(reinterpret_cast<const char*>(w_out_.data()), w_out_.size() * sizeof(float));

    if (!file) {
        throw ConfigError("Failed writing checkpoint: " + filename);
    }
}

void EmbeddingModel::LoadCheckpoint(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        throw CheckpointRestoreError("Cannot open checkpoint: " + filename);
    }

    char magic[sizeof(kCheckpointMagic)];
    uint32_t version;
    uint64_t vocab_size;
    uint32_t embedding_size;
    int64_t global_step;

    if (!file.read(magic, sizeof(magic)) ||
        std::memcmp(magic, kCheckpointMagic, sizeof(magic)) != 0) {
        throw CheckpointRestoreError("Not a checkpoint file: " + filename);
    }
    if (!ReadPod(file, version) || version != kCheckpointVersion) {
        throw CheckpointRestoreError("Unsupported checkpoint version in " + filename);
    }
    if (!ReadPod(file, vocab_size) || !ReadPod(file, embedding_size) ||
        !ReadPod(file, global_step)) {
        throw CheckpointRestoreError("Truncated checkpoint header: " + filename);
    }

    if (vocab_size != vocab_size_) {
        throw CheckpointRestoreError("Vocabulary size mismatch: checkpoint has " +
                                     std::to_string(vocab_size) + ", model has " +
                                     std::to_string(vocab_size_));
    }
    if (embedding_size != static_cast<uint32_t>(config_.embedding_size)) {
        throw CheckpointRestoreError("Embedding size mismatch: checkpoint has " +
                                     std::to_string(embedding_size) + ", config has " +
                                     std::to_string(config_.embedding_size));
    }

    std::vector<float> w_in(w_in_.size());
    std::vector<float> w_out(w_out_.size());
    if (!file.read(reinterpret_cast<char*>(w_in.data()), w_in.size() * sizeof(float)) ||
        !file.read(reinterpret_cast<char*>(w_out.data()), w_out.size() * sizeof(float))) {
        throw CheckpointRestoreError("Truncated checkpoint data: " + filename);
    }
    if (file.peek() != std::ifstream::traits_type::eof()) {
        throw CheckpointRestoreError("Trailing bytes in checkpoint: " + filename);
    }

    w_in_ = std::move(w_in);
    w_out_ = std::move(w_out);
    global_step_ = global_step;
}

} // namespace skipgram

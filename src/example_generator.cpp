#include "example_generator.hpp"
#include "errors.hpp"
#include "vocabulary.hpp"
#include <algorithm>
#include <cmath>

namespace skipgram {

ExampleGenerator::ExampleGenerator(const Vocabulary& vocab, std::vector<int> corpus,
                                   const Config& config)
    : vocab_(vocab), corpus_(std::move(corpus)), config_(config), rng_(config.seed) {
    if (config_.batch_size <= 0) {
        throw ConfigError("batch_size must be positive");
    }
    if (config_.window_size <= 0) {
        throw ConfigError("window_size must be positive");
    }
    if (corpus_.empty()) {
        throw ConfigError("Corpus is empty");
    }
    if (corpus_.size() < 2) {
        throw VocabularyError("Corpus needs at least two words to form a training pair");
    }
    StartEpoch();
}

float ExampleGenerator::KeepProbability(int word_id) const {
    if (config_.subsample <= 0) return 1.0f;

    long long count = vocab_.GetWord(word_id).count;
    if (count <= 0) return 1.0f;

    // P(drop) = 1 - sqrt(t / f)，f 为词在语料中的频率
    double freq = static_cast<double>(count) / WordsPerEpoch();
    double keep_prob = std::sqrt(config_.subsample / freq);
    return static_cast<float>(std::min(1.0, keep_prob));
}

void ExampleGenerator::StartEpoch() {
    // =========================================================================
    // 每个 epoch 开始时对整份语料做一次下采样
    // 窗口定义在保留下来的词序列上，被丢弃的词既不做中心词也不做上下文
    // =========================================================================
    kept_.clear();
    kept_pos_.clear();
    std::uniform_real_distribution<float> uniform_dist(0.0f, 1.0f);

    for (size_t i = 0; i < corpus_.size(); ++i) {
        int word = corpus_[i];
        if (config_.subsample > 0 && KeepProbability(word) < uniform_dist(rng_)) {
            continue;
        }
        kept_.push_back(word);
        kept_pos_.push_back(i);
    }

    raw_cursor_ = 0;
    target_pos_ = 0;
    window_ = 0;
    offset_ = 1;
    if (!kept_.empty()) {
        target_pos_ = static_cast<size_t>(-1);
        AdvanceTarget();
    }
}

void ExampleGenerator::AdvanceTarget() {
    ++target_pos_;
    if (target_pos_ >= kept_.size()) return;

    // 中心词之前（含中心词）的原语料词都算作已处理
    size_t consumed = kept_pos_[target_pos_] + 1;
    total_words_processed_ += static_cast<long long>(consumed - raw_cursor_);
    raw_cursor_ = consumed;

    // 动态窗口：随机选择 [1, window_size] 之间的实际窗口
    if (config_.dynamic_window) {
        std::uniform_int_distribution<int> window_dist(1, config_.window_size);
        window_ = window_dist(rng_);
    } else {
        window_ = config_.window_size;
    }
    offset_ = -window_;
}

void ExampleGenerator::FinishEpoch() {
    total_words_processed_ += static_cast<long long>(corpus_.size() - raw_cursor_);
    raw_cursor_ = corpus_.size();
    // 游标回绕与 epoch 自增在同一把锁内完成，保证每轮只计一次
    current_epoch_++;
}

Batch ExampleGenerator::NextBatch() {
    Batch batch;
    batch.examples.reserve(config_.batch_size);
    batch.labels.reserve(config_.batch_size);

    std::lock_guard<std::mutex> lock(mutex_);
    while (batch.Size() < static_cast<size_t>(config_.batch_size)) {
        if (target_pos_ >= kept_.size()) {
            FinishEpoch();
            StartEpoch();
            continue;
        }
        if (offset_ > window_) {
            AdvanceTarget();
            continue;
        }

        int offset = offset_++;
        if (offset == 0) continue;

        long long context_pos = static_cast<long long>(target_pos_) + offset;
        if (context_pos < 0 || context_pos >= static_cast<long long>(kept_.size())) continue;

        batch.examples.push_back(kept_[target_pos_]);
        batch.labels.push_back(kept_[context_pos]);
    }
    return batch;
}

} // namespace skipgram

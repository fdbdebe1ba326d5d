#include "trainer.hpp"
#include "errors.hpp"
#include "example_generator.hpp"
#include "model.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <random>
#include <thread>
#include <vector>

namespace skipgram {

float ComputeLearningRate(float initial_lr, long long words_processed,
                          long long words_per_epoch, int epochs_to_train) {
    constexpr float kMinLearningRate = 0.0001f;

    double words_to_train = static_cast<double>(words_per_epoch) * epochs_to_train;
    if (words_to_train <= 0) return std::max(kMinLearningRate, initial_lr);

    double progress = static_cast<double>(words_processed) / words_to_train;
    float lr = static_cast<float>(initial_lr * (1.0 - progress));
    return std::max(kMinLearningRate, lr);
}

Trainer::Trainer(ExampleGenerator& generator, EmbeddingModel& model, const Config& config)
    : generator_(generator), model_(model), config_(config) {
    if (config_.concurrent_steps <= 0) {
        throw ConfigError("concurrent_steps must be positive");
    }
}

float Trainer::CurrentLearningRate() const {
    return ComputeLearningRate(config_.learning_rate, generator_.TotalWordsProcessed(),
                               generator_.WordsPerEpoch(), config_.epochs_to_train);
}

void Trainer::TrainEpoch() {
    const int initial_epoch = generator_.CurrentEpoch();
    long long last_words = generator_.TotalWordsProcessed();
    auto last_time = std::chrono::steady_clock::now();

    // 创建训练线程
    std::vector<std::thread> threads;
    for (int i = 0; i < config_.concurrent_steps; ++i) {
        threads.emplace_back(&Trainer::TrainThread, this, i, initial_epoch);
    }

    // 定期输出进度，直到 epoch 变化
    while (true) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.progress_interval_ms));

        int epoch = generator_.CurrentEpoch();
        long long step = model_.GlobalStep();
        long long words = generator_.TotalWordsProcessed();
        float lr = CurrentLearningRate();

        auto now = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(now - last_time).count();
        double rate = elapsed > 0 ? (words - last_words) / elapsed : 0.0;
        last_words = words;
        last_time = now;

        printf("Epoch %4d Step %8lld: lr = %6.4f words/sec = %8.0f\r",
               epoch, step, lr, rate);
        fflush(stdout);

        if (epoch != initial_epoch) break;
    }

    // 等待所有线程完成
    for (auto& thread : threads) {
        thread.join();
    }
    printf("\n");
    epochs_run_++;
}

void Trainer::TrainThread(int thread_id, int initial_epoch) {
    // 每个线程独立的随机数生成器：用于负采样
    std::mt19937_64 rng(config_.seed + static_cast<uint64_t>(epochs_run_) * 1000003u + thread_id);

    while (true) {
        Batch batch = generator_.NextBatch();

        for (size_t i = 0; i < batch.Size(); ++i) {
            // 每个样本都按最新的已处理词数重新计算学习率
            float lr = CurrentLearningRate();
            model_.Update(batch.examples[i], batch.labels[i], lr, rng);
            model_.IncrementGlobalStep();
        }

        if (generator_.CurrentEpoch() != initial_epoch) break;
    }
}

} // namespace skipgram

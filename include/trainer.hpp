#pragma once

#include <cstdint>
#include <string>

namespace skipgram {

class EmbeddingModel;
class ExampleGenerator;

// 线性衰减学习率：max(0.0001, lr0 * (1 - processed / (words_per_epoch * epochs)))
float ComputeLearningRate(float initial_lr, long long words_processed,
                          long long words_per_epoch, int epochs_to_train);

// 多线程训练：每次 TrainEpoch() 训练一个完整 epoch
class Trainer {
public:
    struct Config {
        int concurrent_steps = 12;       // 工作线程数
        int epochs_to_train = 15;        // 总 epoch 数（学习率衰减用）
        float learning_rate = 0.025f;    // 初始学习率
        int progress_interval_ms = 1000; // 进度输出间隔
        uint64_t seed = 0x5eed;

        Config() = default;
    };

    Trainer(ExampleGenerator& generator, EmbeddingModel& model, const Config& config);

    // 训练直到生成器的 epoch 计数变化
    // 结束时各线程可能已多处理了下一 epoch 开头的少量样本
    void TrainEpoch();

    // 根据当前已处理词数计算学习率
    float CurrentLearningRate() const;

private:
    ExampleGenerator& generator_;
    EmbeddingModel& model_;
    Config config_;
    int epochs_run_ = 0;

    void TrainThread(int thread_id, int initial_epoch);
};

} // namespace skipgram

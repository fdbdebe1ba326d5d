#pragma once

#include <cstdint>
#include <string>
#include "example_generator.hpp"
#include "model.hpp"
#include "trainer.hpp"

namespace skipgram {

struct Options {
    // 模型参数
    int embedding_size = 200;            // 向量维度
    int epochs_to_train = 15;            // 训练 epoch 数
    float learning_rate = 0.025f;        // 初始学习率
    int num_neg_samples = 25;            // 每个样本的负采样数
    int batch_size = 500;                // 每次拉取的样本数
    int concurrent_steps = 12;           // 工作线程数
    int window_size = 5;                 // 窗口大小
    int min_count = 5;                   // 最小词频
    float subsample = 1e-3f;             // 下采样阈值，0 关闭

    // 路径
    std::string save_path = "savedata";  // 词汇表和 checkpoint 目录
    std::string train_data;              // 训练语料 (必需)
    std::string eval_data;               // 类比问题，可含 "%d" (必需)
    std::string log_file = "train_log.txt";

    // 运行模式
    bool load_data = false;              // 从 save_path 加载 checkpoint
    bool resume = false;                 // 加载后继续训练
    bool dry_run = false;                // 不保存任何文件
    int interactive = -1;                // -1: 未指定, 0: 关, 1: 开

    // 其他
    uint64_t seed = 0x5eed;
    bool serialize_updates = false;      // 串行化模型更新
    bool fixed_window = false;           // 固定窗口，不随机缩小

    bool help = false;

    Options() = default;

    bool Interactive() const { return interactive > 0; }

    std::string VocabPath() const { return save_path + "/vocab.txt"; }
    std::string CheckpointPath() const { return save_path + "/model.ckpt"; }

    ExampleGenerator::Config GeneratorConfig() const;
    EmbeddingModel::Config ModelConfig() const;
    Trainer::Config TrainerConfig() const;
};

// 解析命令行参数，无效参数抛出 ConfigError
Options ParseOptions(int argc, char** argv);

// 校验参数并处理模式之间的依赖：
//   resume 隐含 load_data
//   load_data 且不 resume 时不训练，interactive 默认开启
void ResolveOptions(Options& options);

void PrintUsage(const char* prog_name);

// 输出生效的参数
void LogOptions(const Options& options);

} // namespace skipgram

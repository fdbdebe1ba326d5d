#pragma once

#include <array>
#include <string>
#include <vector>

namespace skipgram {

class EmbeddingModel;
class NormalizedEmbeddings;
class Vocabulary;

// 类比问题 a:b :: c:d，四个词的 id
using AnalogyQuestion = std::array<int, 4>;
// 每个问题的前 kAnalogyCount 个预测
constexpr int kAnalogyCount = 4;
using AnalogyPrediction = std::array<int, kAnalogyCount>;

// 一个问题文件
struct QuestionBlock {
    std::string path;
    std::vector<AnalogyQuestion> questions;
    long long skipped = 0;               // 含未登录词或格式错误而跳过的行
};

// 一个问题块的评估结果
struct BlockReport {
    std::array<long long, kAnalogyCount> correct{};   // 各优先级命中数
    std::array<long long, kAnalogyCount + 1> skips{}; // 跳过次数 0..4 的问题数
    long long total = 0;                 // 已加载的问题数
    long long skipped_at_load = 0;

    long long Guessed() const;
    // 命中率 (%)，分母为文件中的全部问题（含加载时跳过的）
    double BucketAccuracy(int bucket) const;
    // guessed / total (%)
    double Accuracy() const;
    // 跳过 n 次的问题占比 (%)
    double SkipShare(int n) const;
};

struct EvalReport {
    std::vector<BlockReport> blocks;

    long long Guessed() const;
    long long Total() const;
};

// 类比评估：Idle -> Loaded -> Evaluating -> Reported
class AnalogyEvaluator {
public:
    enum class State { kIdle, kLoaded, kEvaluating, kReported };

    explicit AnalogyEvaluator(const Vocabulary& vocab);

    // 读取问题文件；路径中含 "%d" 时依次读取 1, 2, ... 直到文件不存在
    void Load(const std::string& eval_path);

    // 预测 c + (b - a) 最近的 kAnalogyCount 个词
    std::vector<AnalogyPrediction> Predict(const NormalizedEmbeddings& embeddings,
                                           const std::vector<AnalogyQuestion>& questions) const;

    // 评估所有问题块并输出结果
    EvalReport Evaluate(const EmbeddingModel& model);

    // 根据预测结果给一个问题块打分
    static BlockReport ScoreBlock(const QuestionBlock& block,
                                  const std::vector<AnalogyPrediction>& predictions);

    const std::vector<QuestionBlock>& Blocks() const { return blocks_; }
    State CurrentState() const { return state_; }

private:
    const Vocabulary& vocab_;
    std::vector<QuestionBlock> blocks_;
    State state_ = State::kIdle;

    QuestionBlock ReadFile(const std::string& path) const;
    static void Report(const EvalReport& report);
};

} // namespace skipgram

#include "analogy.hpp"
#include "embedding_index.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "model.hpp"
#include "vocabulary.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace skipgram {

namespace {

// 每次预测的问题数
constexpr size_t kEvalChunkSize = 2500;

bool FileExists(const std::string& path) {
    std::ifstream file(path);
    return static_cast<bool>(file);
}

std::string NumberedPath(const std::string& pattern, int index) {
    std::string path = pattern;
    path.replace(path.find("%d"), 2, std::to_string(index));
    return path;
}

std::string Percentages(const BlockReport& report, bool skips) {
    std::string list;
    for (int i = 0; i < kAnalogyCount; ++i) {
        double value = skips ? report.SkipShare(i + 1) : report.BucketAccuracy(i);
        if (i) list += ' ';
        list += StringPrintf("%5.1f%%", value);
    }
    return list;
}

} // namespace

long long BlockReport::Guessed() const {
    long long guessed = 0;
    for (long long c : correct) guessed += c;
    return guessed;
}

double BlockReport::BucketAccuracy(int bucket) const {
    long long asked = total + skipped_at_load;
    return asked > 0 ? correct[bucket] * 100.0 / asked : 0.0;
}

double BlockReport::Accuracy() const {
    return total > 0 ? Guessed() * 100.0 / total : 0.0;
}

double BlockReport::SkipShare(int n) const {
    long long questions = 0;
    for (long long s : skips) questions += s;
    return questions > 0 ? skips[n] * 100.0 / questions : 0.0;
}

long long EvalReport::Guessed() const {
    long long guessed = 0;
    for (const auto& block : blocks) guessed += block.Guessed();
    return guessed;
}

long long EvalReport::Total() const {
    long long total = 0;
    for (const auto& block : blocks) total += block.total;
    return total;
}

AnalogyEvaluator::AnalogyEvaluator(const Vocabulary& vocab) : vocab_(vocab) {}

QuestionBlock AnalogyEvaluator::ReadFile(const std::string& path) const {
    std::ifstream file(path);
    if (!file) {
        throw AnalogyFileMissing("Cannot open analogy file: " + path);
    }

    QuestionBlock block;
    block.path = path;

    std::string line;
    while (std::getline(file, line)) {
        std::transform(line.begin(), line.end(), line.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        std::istringstream iss(line);
        std::vector<std::string> words;
        std::string word;
        while (iss >> word) {
            words.push_back(word);
        }

        // 跳过空行和 ":" 开头的分节标题
        if (words.empty() || words[0][0] == ':') continue;

        if (words.size() != 4) {
            block.skipped++;
            continue;
        }

        AnalogyQuestion question;
        bool known = true;
        for (int i = 0; i < 4; ++i) {
            question[i] = vocab_.GetWordIndex(words[i]);
            if (question[i] < 0) known = false;
        }

        // 含未登录词的问题计入跳过数
        if (!known) {
            block.skipped++;
            continue;
        }
        block.questions.push_back(question);
    }

    Log() << StringPrintf("Eval analogy file: \"%s\", questions %4zu, skipped %lld",
                          path.c_str(), block.questions.size(), block.skipped);
    return block;
}

void AnalogyEvaluator::Load(const std::string& eval_path) {
    std::vector<QuestionBlock> blocks;

    if (eval_path.find("%d") != std::string::npos) {
        // 编号文件：第一个必须存在，缺失的第 N 个表示序列结束
        if (!FileExists(NumberedPath(eval_path, 1))) {
            throw AnalogyFileMissing("Cannot open analogy file: " + NumberedPath(eval_path, 1));
        }
        for (int index = 1; FileExists(NumberedPath(eval_path, index)); ++index) {
            blocks.push_back(ReadFile(NumberedPath(eval_path, index)));
        }
    } else {
        blocks.push_back(ReadFile(eval_path));
    }

    blocks_ = std::move(blocks);
    state_ = State::kLoaded;
}

std::vector<AnalogyPrediction> AnalogyEvaluator::Predict(
    const NormalizedEmbeddings& embeddings,
    const std::vector<AnalogyQuestion>& questions) const {
    const int dim = embeddings.EmbeddingSize();
    std::vector<AnalogyPrediction> predictions;
    predictions.reserve(questions.size());

    for (const auto& question : questions) {
        // target = c + (b - a)，在单位球面上
        const float* a = embeddings.Row(question[0]);
        const float* b = embeddings.Row(question[1]);
        const float* c = embeddings.Row(question[2]);
        std::vector<float> target(dim);
        for (int i = 0; i < dim; ++i) {
            target[i] = c[i] + (b[i] - a[i]);
        }

        AnalogyPrediction prediction;
        prediction.fill(-1);
        auto top = embeddings.TopK(target, kAnalogyCount);
        for (size_t j = 0; j < top.size(); ++j) {
            prediction[j] = top[j].first;
        }
        predictions.push_back(prediction);
    }
    return predictions;
}

BlockReport AnalogyEvaluator::ScoreBlock(const QuestionBlock& block,
                                         const std::vector<AnalogyPrediction>& predictions) {
    BlockReport report;
    report.total = static_cast<long long>(block.questions.size());
    report.skipped_at_load = block.skipped;

    for (size_t q = 0; q < block.questions.size(); ++q) {
        const auto& question = block.questions[q];
        const auto& prediction = predictions[q];

        int prio = 0;
        int skips = 0;
        for (int j = 0; j < kAnalogyCount; ++j) {
            int predicted = prediction[j];
            if (predicted == question[3]) {
                // 命中，例如 [italy, rome, france, paris]
                report.correct[prio]++;
                break;
            } else if (std::find(question.begin(), question.begin() + 3, predicted) !=
                       question.begin() + 3) {
                // 问题中已有的词不占优先级
                skips++;
            } else {
                prio++;
            }
        }
        report.skips[skips]++;
    }
    return report;
}

EvalReport AnalogyEvaluator::Evaluate(const EmbeddingModel& model) {
    if (state_ == State::kIdle) {
        throw std::logic_error("Need to read analogy questions before evaluation");
    }
    state_ = State::kEvaluating;

    NormalizedEmbeddings embeddings(model.InputEmbeddings(), model.VocabSize(),
                                    model.EmbeddingSize());

    EvalReport report;
    for (const auto& block : blocks_) {
        std::vector<AnalogyPrediction> predictions;
        predictions.reserve(block.questions.size());

        for (size_t start = 0; start < block.questions.size(); start += kEvalChunkSize) {
            size_t limit = std::min(start + kEvalChunkSize, block.questions.size());
            std::vector<AnalogyQuestion> chunk(block.questions.begin() + start,
                                               block.questions.begin() + limit);
            auto chunk_predictions = Predict(embeddings, chunk);
            predictions.insert(predictions.end(), chunk_predictions.begin(),
                               chunk_predictions.end());
        }
        report.blocks.push_back(ScoreBlock(block, predictions));
    }

    Report(report);
    state_ = State::kReported;
    return report;
}

void AnalogyEvaluator::Report(const EvalReport& report) {
    const bool multi_block = report.blocks.size() > 1;

    for (size_t i = 0; i < report.blocks.size(); ++i) {
        const auto& block = report.blocks[i];
        std::string suffix = multi_block ? StringPrintf(" for #%zu", i + 1) : "";
        Log() << StringPrintf("Eval%s %4lld/%lld accuracy = %5.1f%% [%s] skips [%s]",
                              suffix.c_str(), block.Guessed(), block.total,
                              block.Accuracy(), Percentages(block, false).c_str(),
                              Percentages(block, true).c_str());
    }

    if (multi_block) {
        long long total = report.Total();
        double accuracy = total > 0 ? report.Guessed() * 100.0 / total : 0.0;
        Log() << StringPrintf("Eval global %4lld/%lld accuracy = %4.1f%%",
                              report.Guessed(), total, accuracy);
    }
}

} // namespace skipgram

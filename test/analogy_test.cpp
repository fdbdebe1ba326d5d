#include <gtest/gtest.h>
#include "analogy.hpp"
#include "embedding_index.hpp"
#include "errors.hpp"
#include "model.hpp"
#include "vocabulary.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace skipgram;

class AnalogyTest : public ::testing::Test {
protected:
    void SetUp() override {
        // paris(4) france(3) rome(2) italy(1)
        std::vector<std::string> tokens;
        for (int i = 0; i < 4; ++i) tokens.push_back("paris");
        for (int i = 0; i < 3; ++i) tokens.push_back("france");
        for (int i = 0; i < 2; ++i) tokens.push_back("rome");
        tokens.push_back("italy");
        vocab_.LearnFromTokens(tokens, 1);

        paris_ = vocab_.GetWordIndex("paris");
        france_ = vocab_.GetWordIndex("france");
        rome_ = vocab_.GetWordIndex("rome");
        italy_ = vocab_.GetWordIndex("italy");

        config_.embedding_size = 4;
        config_.num_neg_samples = 0;
    }

    void TearDown() override {
        for (const char* suffix : {".txt", "-1.txt", "-2.txt"}) {
            std::remove(QuestionsPath(suffix).c_str());
        }
    }

    // 每个用例使用独立的问题文件，允许并行运行
    static std::string QuestionsPath(const std::string& suffix) {
        return std::string("test_questions_") +
               ::testing::UnitTest::GetInstance()->current_test_info()->name() + suffix;
    }

    static void WriteFile(const std::string& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
    }

    // italy = e0, rome = e1, france = e2, paris = e1 + e2 - e0, UNK = e3
    void ConstructEmbeddings(EmbeddingModel& model) const {
        auto& w = model.MutableInputEmbeddings();
        std::fill(w.begin(), w.end(), 0.0f);
        auto set = [&](int row, std::vector<float> values) {
            std::copy(values.begin(), values.end(), w.begin() + row * 4);
        };
        set(0, {0, 0, 0, 1});
        set(italy_, {1, 0, 0, 0});
        set(rome_, {0, 1, 0, 0});
        set(france_, {0, 0, 1, 0});
        set(paris_, {-1, 1, 1, 0});
    }

    Vocabulary vocab_;
    EmbeddingModel::Config config_;
    int paris_, france_, rome_, italy_;
};

TEST_F(AnalogyTest, LoadSkipsUnknownWordsAndHeaders) {
    WriteFile(QuestionsPath(".txt"),
              ": capital-common-countries\n"
              "Italy Rome France Paris\n"
              "\n"
              "italy rome germany berlin\n"
              "italy rome france\n"
              "rome italy paris france\n");

    AnalogyEvaluator evaluator(vocab_);
    EXPECT_EQ(evaluator.CurrentState(), AnalogyEvaluator::State::kIdle);
    evaluator.Load(QuestionsPath(".txt"));
    EXPECT_EQ(evaluator.CurrentState(), AnalogyEvaluator::State::kLoaded);

    ASSERT_EQ(evaluator.Blocks().size(), 1u);
    const auto& block = evaluator.Blocks()[0];
    ASSERT_EQ(block.questions.size(), 2u);
    EXPECT_EQ(block.skipped, 2);
    EXPECT_EQ(block.questions[0], (AnalogyQuestion{italy_, rome_, france_, paris_}));
    EXPECT_EQ(block.questions[1], (AnalogyQuestion{rome_, italy_, paris_, france_}));
}

TEST_F(AnalogyTest, PredictsConstructedAnalogy) {
    EmbeddingModel model(vocab_, config_);
    ConstructEmbeddings(model);

    AnalogyEvaluator evaluator(vocab_);
    NormalizedEmbeddings embeddings(model.InputEmbeddings(), model.VocabSize(),
                                    model.EmbeddingSize());
    std::vector<AnalogyQuestion> questions = {AnalogyQuestion{italy_, rome_, france_, paris_}};
    auto predictions = evaluator.Predict(embeddings, questions);

    ASSERT_EQ(predictions.size(), 1u);
    EXPECT_EQ(predictions[0][0], paris_);
}

TEST_F(AnalogyTest, EvaluateReportsRankZeroHit) {
    WriteFile(QuestionsPath(".txt"), "italy rome france paris\n");
    EmbeddingModel model(vocab_, config_);
    ConstructEmbeddings(model);

    AnalogyEvaluator evaluator(vocab_);
    evaluator.Load(QuestionsPath(".txt"));
    EvalReport report = evaluator.Evaluate(model);
    EXPECT_EQ(evaluator.CurrentState(), AnalogyEvaluator::State::kReported);

    ASSERT_EQ(report.blocks.size(), 1u);
    const auto& block = report.blocks[0];
    EXPECT_EQ(block.correct[0], 1);
    EXPECT_EQ(block.Guessed(), 1);
    EXPECT_EQ(block.skips[0], 1);
    EXPECT_DOUBLE_EQ(block.Accuracy(), 100.0);
}

TEST_F(AnalogyTest, ScoringBucketsAndSkips) {
    WriteFile(QuestionsPath(".txt"),
              "italy rome france paris\n"
              "rome italy paris france\n"
              "france paris italy rome\n"
              "italy rome germany berlin\n");

    AnalogyEvaluator evaluator(vocab_);
    evaluator.Load(QuestionsPath(".txt"));
    const auto& block = evaluator.Blocks()[0];
    ASSERT_EQ(block.questions.size(), 3u);

    std::vector<AnalogyPrediction> predictions = {
        AnalogyPrediction{paris_, france_, rome_, 0},   // 第一位命中
        AnalogyPrediction{0, italy_, 0, france_},       // 跳过 italy 后在优先级 2 命中
        AnalogyPrediction{0, 0, 0, 0},                  // 未命中
    };
    BlockReport report = AnalogyEvaluator::ScoreBlock(block, predictions);

    EXPECT_EQ(report.correct[0], 1);
    EXPECT_EQ(report.correct[1], 0);
    EXPECT_EQ(report.correct[2], 1);
    EXPECT_EQ(report.correct[3], 0);

    EXPECT_DOUBLE_EQ(report.BucketAccuracy(0), 25.0);
    EXPECT_DOUBLE_EQ(report.BucketAccuracy(1), 0.0);
    EXPECT_DOUBLE_EQ(report.BucketAccuracy(2), 25.0);
    EXPECT_DOUBLE_EQ(report.BucketAccuracy(3), 0.0);

    EXPECT_EQ(report.skips[0], 2);
    EXPECT_EQ(report.skips[1], 1);
    EXPECT_EQ(report.skips[2], 0);

    EXPECT_EQ(report.total, 3);
    EXPECT_EQ(report.skipped_at_load, 1);
    EXPECT_EQ(report.Guessed(), 2);
    EXPECT_NEAR(report.Accuracy(), 200.0 / 3, 1e-9);
}

TEST_F(AnalogyTest, NumberedFilePattern) {
    WriteFile(QuestionsPath("-1.txt"), "italy rome france paris\n");
    WriteFile(QuestionsPath("-2.txt"), "rome italy paris france\nfrance paris italy rome\n");

    EmbeddingModel model(vocab_, config_);
    ConstructEmbeddings(model);

    AnalogyEvaluator evaluator(vocab_);
    evaluator.Load(QuestionsPath("-%d.txt"));
    ASSERT_EQ(evaluator.Blocks().size(), 2u);
    EXPECT_EQ(evaluator.Blocks()[0].questions.size(), 1u);
    EXPECT_EQ(evaluator.Blocks()[1].questions.size(), 2u);

    EvalReport report = evaluator.Evaluate(model);
    ASSERT_EQ(report.blocks.size(), 2u);
    EXPECT_EQ(report.Total(), 3);
    EXPECT_GE(report.Guessed(), 1);
}

TEST_F(AnalogyTest, MissingFiles) {
    AnalogyEvaluator evaluator(vocab_);
    EXPECT_THROW(evaluator.Load("no_such_questions.txt"), AnalogyFileMissing);
    EXPECT_THROW(evaluator.Load("no_such_questions-%d.txt"), AnalogyFileMissing);
    EXPECT_EQ(evaluator.CurrentState(), AnalogyEvaluator::State::kIdle);
}

TEST_F(AnalogyTest, EvaluateBeforeLoad) {
    EmbeddingModel model(vocab_, config_);
    AnalogyEvaluator evaluator(vocab_);
    EXPECT_THROW(evaluator.Evaluate(model), std::logic_error);
}

TEST(NormalizedEmbeddingsTest, TopKOrdersBySimilarity) {
    std::vector<float> matrix = {
        1, 0,
        0, 2,
        3, 3,
        0, 0,
    };
    NormalizedEmbeddings embeddings(matrix, 4, 2);

    // 行已归一化，零向量保持为零
    EXPECT_FLOAT_EQ(embeddings.Row(1)[1], 1.0f);
    EXPECT_FLOAT_EQ(embeddings.Row(3)[0], 0.0f);

    auto top = embeddings.TopK({1, 0}, 3);
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0].first, 0);
    EXPECT_FLOAT_EQ(top[0].second, 1.0f);
    EXPECT_EQ(top[1].first, 2);
    // 同分 (0) 时 id 小的在前
    EXPECT_EQ(top[2].first, 1);

    EXPECT_EQ(embeddings.TopK({1, 0}, 10).size(), 4u);
}

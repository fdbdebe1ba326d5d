#include <gtest/gtest.h>
#include "query.hpp"
#include "model.hpp"
#include "vocabulary.hpp"
#include <algorithm>
#include <memory>

using namespace skipgram;

class QueryTest : public ::testing::Test {
protected:
    void SetUp() override {
        // king(5) queen(4) man(3) woman(2) apple(1)
        std::vector<std::string> tokens;
        const std::vector<std::pair<std::string, int>> counts = {
            {"king", 5}, {"queen", 4}, {"man", 3}, {"woman", 2}, {"apple", 1}};
        for (const auto& entry : counts) {
            for (int i = 0; i < entry.second; ++i) tokens.push_back(entry.first);
        }
        vocab_.LearnFromTokens(tokens, 1);

        EmbeddingModel::Config config;
        config.embedding_size = 3;
        config.num_neg_samples = 0;
        model_ = std::make_unique<EmbeddingModel>(vocab_, config);

        // 维度: 0 = 王室, 1 = 性别, 2 = 水果
        auto& w = model_->MutableInputEmbeddings();
        auto set = [&](const std::string& word, std::vector<float> values) {
            std::copy(values.begin(), values.end(), w.begin() + vocab_.Lookup(word) * 3);
        };
        set("UNK", {0, -0.1f, -1});
        set("king", {1, 1, 0});
        set("queen", {1, -1, 0});
        set("man", {0, 1, 0});
        set("woman", {0, -1, 0});
        set("apple", {0, 0, 1});
    }

    Vocabulary vocab_;
    std::unique_ptr<EmbeddingModel> model_;
};

TEST_F(QueryTest, AnalogyFindsFourthWord) {
    QueryEngine queries(vocab_, *model_);

    // man:king :: woman:?
    auto words = queries.Analogy("man", "king", "woman");
    ASSERT_EQ(words.size(), 4u);
    EXPECT_EQ(words[0], "queen");
}

TEST_F(QueryTest, AnalogyWithUnknownWordUsesUnk) {
    QueryEngine queries(vocab_, *model_);
    auto words = queries.Analogy("man", "king", "nonexistent");
    EXPECT_EQ(words.size(), 4u);
}

TEST_F(QueryTest, NearbyRanksByCosine) {
    QueryEngine queries(vocab_, *model_);

    auto results = queries.Nearby({"king", "apple"}, 3);
    ASSERT_EQ(results.size(), 2u);

    ASSERT_EQ(results[0].size(), 3u);
    EXPECT_EQ(results[0][0].first, "king");
    EXPECT_NEAR(results[0][0].second, 1.0f, 1e-5f);
    EXPECT_EQ(results[0][1].first, "man");
    EXPECT_NEAR(results[0][1].second, 0.7071f, 1e-4f);
    // queen 和 apple 与 king 正交，同分时 id 小的 queen 在前
    EXPECT_EQ(results[0][2].first, "queen");
    EXPECT_NEAR(results[0][2].second, 0.0f, 1e-6f);

    EXPECT_EQ(results[1][0].first, "apple");
}

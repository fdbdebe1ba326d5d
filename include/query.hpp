#pragma once

#include <string>
#include <utility>
#include <vector>
#include "embedding_index.hpp"

namespace skipgram {

class EmbeddingModel;
class Vocabulary;

// 交互式查询：基于输入 embedding 的归一化快照
class QueryEngine {
public:
    QueryEngine(const Vocabulary& vocab, const EmbeddingModel& model);

    // w0:w1 :: w2:? 的候选词，按相似度排序
    std::vector<std::string> Analogy(const std::string& w0, const std::string& w1,
                                     const std::string& w2) const;

    // 每个词最近的 k 个词及余弦相似度
    std::vector<std::vector<std::pair<std::string, float>>> Nearby(
        const std::vector<std::string>& words, size_t k = 20) const;

private:
    const Vocabulary& vocab_;
    NormalizedEmbeddings embeddings_;
};

} // namespace skipgram

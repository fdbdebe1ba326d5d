#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace skipgram {

// 输入 embedding 的 L2 归一化快照，用于余弦相似度查询
class NormalizedEmbeddings {
public:
    NormalizedEmbeddings(const std::vector<float>& embeddings, size_t vocab_size,
                         int embedding_size);

    const float* Row(int word_index) const {
        return &data_[static_cast<size_t>(word_index) * dim_];
    }
    size_t VocabSize() const { return vocab_size_; }
    int EmbeddingSize() const { return dim_; }

    // 与 query 点积最大的 k 个词 (id, 相似度)，同分时 id 小的在前
    std::vector<std::pair<int, float>> TopK(const std::vector<float>& query, size_t k) const;

private:
    std::vector<float> data_;
    size_t vocab_size_;
    int dim_;
};

} // namespace skipgram

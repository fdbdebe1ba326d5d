#include "embedding_index.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace skipgram {

NormalizedEmbeddings::NormalizedEmbeddings(const std::vector<float>& embeddings,
                                           size_t vocab_size, int embedding_size)
    : data_(embeddings.begin(), embeddings.begin() + vocab_size * embedding_size),
      vocab_size_(vocab_size), dim_(embedding_size) {
    for (size_t i = 0; i < vocab_size_; ++i) {
        float* row = &data_[i * dim_];
        float norm = 0.0f;
        for (int c = 0; c < dim_; ++c) {
            norm += row[c] * row[c];
        }
        norm = std::sqrt(norm);
        if (norm <= 0.0f) continue;
        for (int c = 0; c < dim_; ++c) {
            row[c] /= norm;
        }
    }
}

std::vector<std::pair<int, float>> NormalizedEmbeddings::TopK(const std::vector<float>& query,
                                                              size_t k) const {
    std::vector<float> scores(vocab_size_, 0.0f);
    for (size_t i = 0; i < vocab_size_; ++i) {
        const float* row = &data_[i * dim_];
        float dot = 0.0f;
        for (int c = 0; c < dim_; ++c) {
            dot += row[c] * query[c];
        }
        scores[i] = dot;
    }

    k = std::min(k, vocab_size_);
    std::vector<int> order(vocab_size_);
    std::iota(order.begin(), order.end(), 0);
    std::partial_sort(order.begin(), order.begin() + k, order.end(),
                      [&scores](int a, int b) {
                          if (scores[a] != scores[b]) return scores[a] > scores[b];
                          return a < b;
                      });

    std::vector<std::pair<int, float>> results;
    results.reserve(k);
    for (size_t i = 0; i < k; ++i) {
        results.emplace_back(order[i], scores[order[i]]);
    }
    return results;
}

} // namespace skipgram

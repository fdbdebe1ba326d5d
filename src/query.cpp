#include "query.hpp"
#include "analogy.hpp"
#include "model.hpp"
#include "vocabulary.hpp"

namespace skipgram {

QueryEngine::QueryEngine(const Vocabulary& vocab, const EmbeddingModel& model)
    : vocab_(vocab),
      embeddings_(model.InputEmbeddings(), model.VocabSize(), model.EmbeddingSize()) {}

std::vector<std::string> QueryEngine::Analogy(const std::string& w0, const std::string& w1,
                                              const std::string& w2) const {
    const int dim = embeddings_.EmbeddingSize();
    const float* a = embeddings_.Row(vocab_.Lookup(w0));
    const float* b = embeddings_.Row(vocab_.Lookup(w1));
    const float* c = embeddings_.Row(vocab_.Lookup(w2));

    // 计算类比向量: w2 + (w1 - w0)
    std::vector<float> target(dim);
    for (int i = 0; i < dim; ++i) {
        target[i] = c[i] + (b[i] - a[i]);
    }

    std::vector<std::string> words;
    for (const auto& candidate : embeddings_.TopK(target, kAnalogyCount)) {
        words.push_back(vocab_.GetWord(candidate.first).word);
    }
    return words;
}

std::vector<std::vector<std::pair<std::string, float>>> QueryEngine::Nearby(
    const std::vector<std::string>& words, size_t k) const {
    const int dim = embeddings_.EmbeddingSize();
    std::vector<std::vector<std::pair<std::string, float>>> results;

    for (const auto& word : words) {
        const float* row = embeddings_.Row(vocab_.Lookup(word));
        std::vector<float> query(row, row + dim);

        std::vector<std::pair<std::string, float>> neighbors;
        for (const auto& candidate : embeddings_.TopK(query, k)) {
            neighbors.emplace_back(vocab_.GetWord(candidate.first).word, candidate.second);
        }
        results.push_back(std::move(neighbors));
    }
    return results;
}

} // namespace skipgram

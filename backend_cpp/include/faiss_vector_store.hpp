#pragma once

#include "knowledge_base.hpp"
#include "embedding_service.hpp"
#include <string>
#include <vector>
#include <memory>

// Forward declare FAISS Index
namespace faiss { struct Index; }

namespace edubot {

struct ScoredEntry {
    const CorpusEntry* entry = nullptr;
    size_t row = 0;      // corpus insertion position
    float score = 0.0f;  // cosine similarity
};

/**
 * @brief Exact cosine-similarity index over the knowledge corpus.
 *
 * Built once from the whole corpus, read-only afterwards. Concurrent searches on a
 * built store need no locking.
 */
class FaissVectorStore {
public:
    FaissVectorStore();
    ~FaissVectorStore();

    FaissVectorStore(const FaissVectorStore&) = delete;
    FaissVectorStore& operator=(const FaissVectorStore&) = delete;

    /**
     * @brief Embeds title + tags + body of every entry and indexes the normalized vectors.
     * @throws KnowledgeBaseError if the corpus is empty or the embedder output is unusable.
     */
    void build(std::vector<CorpusEntry> entries, Embedder& embedder);

    /**
     * @brief The min(n, size()) most similar entries, score descending,
     *        ties in corpus insertion order.
     * @throws std::invalid_argument on a query of the wrong dimension.
     */
    std::vector<ScoredEntry> search(const std::vector<float>& query_vector, size_t n) const;

    size_t size() const { return entries_.size(); }
    size_t dimension() const { return dimension_; }
    bool empty() const { return entries_.empty(); }

    const std::vector<CorpusEntry>& entries() const { return entries_; }
    KnowledgeBaseStats stats() const { return compute_stats(entries_); }

private:
    size_t dimension_ = 0;
    std::unique_ptr<faiss::Index> index_;
    std::vector<CorpusEntry> entries_;
};

} // namespace edubot

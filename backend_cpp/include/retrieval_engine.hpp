#pragma once
#include "faiss_vector_store.hpp"
#include "category_reranker.hpp"
#include "ServiceMetrics.hpp"
#include <memory>
#include <string>
#include <vector>

namespace edubot {

constexpr size_t kPoolMultiplier = 6;
constexpr size_t kMinPoolSize = 20;

// clamp(6 * k, 20, corpus_size)
size_t candidate_pool_size(size_t k, size_t corpus_size);

RetrievedChunk to_chunk(const ScoredEntry& hit);

class RetrievalEngine {
public:
    RetrievalEngine(std::shared_ptr<const FaissVectorStore> store,
                    std::shared_ptr<Embedder> embedder,
                    RerankOptions options = {},
                    ServiceMetrics* metrics = nullptr);

    /**
     * @brief Embeds the query, pulls the candidate pool and reranks it.
     * @return min(k, corpus size) chunks, score descending.
     */
    std::vector<RetrievedChunk> retrieve(const std::string& query,
                                         const std::string& category_hint,
                                         size_t k);

    // Raw nearest neighbours, pool-sized for k, not yet reranked.
    std::vector<RetrievedChunk> generate_candidates(const std::vector<float>& query_vector, size_t k) const;

    const FaissVectorStore& store() const { return *vector_store_; }

private:
    std::shared_ptr<const FaissVectorStore> vector_store_;
    std::shared_ptr<Embedder> embedder_;
    RerankOptions options_;
    ServiceMetrics* metrics_;
};

} // namespace edubot

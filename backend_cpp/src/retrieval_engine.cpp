#include "retrieval_engine.hpp"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>

namespace edubot {

size_t candidate_pool_size(size_t k, size_t corpus_size) {
    // Beyond this k the pool is the whole corpus; also keeps k * kPoolMultiplier from wrapping
    if (k > corpus_size / kPoolMultiplier) return corpus_size;
    return std::min(std::max(k * kPoolMultiplier, kMinPoolSize), corpus_size);
}

RetrievedChunk to_chunk(const ScoredEntry& hit) {
    RetrievedChunk chunk;
    chunk.id = hit.entry->id;
    chunk.title = hit.entry->title;
    chunk.category = hit.entry->category;
    chunk.content = hit.entry->content;
    chunk.tags = hit.entry->tags;
    chunk.score = hit.score;
    chunk.row = hit.row;
    return chunk;
}

RetrievalEngine::RetrievalEngine(std::shared_ptr<const FaissVectorStore> store,
                                 std::shared_ptr<Embedder> embedder,
                                 RerankOptions options,
                                 ServiceMetrics* metrics)
    : vector_store_(std::move(store)),
      embedder_(std::move(embedder)),
      options_(options),
      metrics_(metrics) {}

std::vector<RetrievedChunk> RetrievalEngine::generate_candidates(const std::vector<float>& query_vector,
                                                                 size_t k) const {
    size_t pool = candidate_pool_size(k, vector_store_->size());
    if (metrics_) metrics_->last_candidate_pool.store(pool);

    auto hits = vector_store_->search(query_vector, pool);

    std::vector<RetrievedChunk> candidates;
    candidates.reserve(hits.size());
    for (const auto& hit : hits) {
        candidates.push_back(to_chunk(hit));
    }
    return candidates;
}

std::vector<RetrievedChunk> RetrievalEngine::retrieve(const std::string& query,
                                                      const std::string& category_hint,
                                                      size_t k) {
    auto start = std::chrono::steady_clock::now();

    // 1. Embed
    auto query_vector = embedder_->embed(query);

    // 2. Candidate pool
    auto candidates = generate_candidates(query_vector, k);

    // 3. Soft category preference
    auto ranked = rank(candidates, category_hint, k, options_);

    double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    if (metrics_) metrics_->retrieval_latency_ms.store(duration);

    spdlog::info("⏱️ Retrieval: {} of {} candidates kept (top_k={}, hint='{}') in {:.2f} ms",
                 ranked.size(), candidates.size(), k, category_hint, duration);
    return ranked;
}

} // namespace edubot

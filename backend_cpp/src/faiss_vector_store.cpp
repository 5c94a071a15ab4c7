#include "faiss_vector_store.hpp"
#include <faiss/IndexFlat.h>
#include <faiss/utils/distances.h>
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace edubot {

FaissVectorStore::FaissVectorStore() = default;

FaissVectorStore::~FaissVectorStore() = default;

void FaissVectorStore::build(std::vector<CorpusEntry> entries, Embedder& embedder) {
    if (entries.empty()) {
        throw KnowledgeBaseError("Cannot build index: corpus is empty");
    }

    std::vector<std::string> texts;
    texts.reserve(entries.size());
    for (const auto& entry : entries) {
        texts.push_back(compose_embedding_text(entry));
    }

    spdlog::info("🧬 Embedding {} articles with {} embedder...", texts.size(), embedder.name());
    auto vectors = embedder.embed_batch(texts);
    if (vectors.size() != entries.size()) {
        throw KnowledgeBaseError("Embedder returned " + std::to_string(vectors.size()) +
                                 " vectors for " + std::to_string(entries.size()) + " entries");
    }

    size_t dim = embedder.dimension();
    std::vector<float> vectors_flat;
    vectors_flat.reserve(dim * vectors.size());
    for (size_t i = 0; i < vectors.size(); ++i) {
        if (vectors[i].size() != dim) {
            throw KnowledgeBaseError("Embedding for '" + entries[i].id + "' has dimension " +
                                     std::to_string(vectors[i].size()) + ", expected " + std::to_string(dim));
        }
        vectors_flat.insert(vectors_flat.end(), vectors[i].begin(), vectors[i].end());
    }

    // Inner product on unit vectors == cosine similarity
    faiss::fvec_renorm_L2(dim, entries.size(), vectors_flat.data());

    auto index = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dim));
    index->add(static_cast<faiss::idx_t>(entries.size()), vectors_flat.data());

    // Commit only after everything succeeded: never a partial index
    dimension_ = dim;
    index_ = std::move(index);
    entries_ = std::move(entries);

    spdlog::info("✅ Index ready. {} articles, dim={}", entries_.size(), dimension_);
}

std::vector<ScoredEntry> FaissVectorStore::search(const std::vector<float>& query_vector, size_t n) const {
    if (!index_ || entries_.empty() || n == 0) return {};
    if (query_vector.size() != dimension_) {
        throw std::invalid_argument("Query dimension " + std::to_string(query_vector.size()) +
                                    " does not match index dimension " + std::to_string(dimension_));
    }

    size_t k = std::min(n, entries_.size());

    std::vector<float> query_copy = query_vector;
    faiss::fvec_renorm_L2(dimension_, 1, query_copy.data());

    std::vector<float> scores(k);
    std::vector<faiss::idx_t> indices(k);
    index_->search(1, query_copy.data(), static_cast<faiss::idx_t>(k), scores.data(), indices.data());

    std::vector<ScoredEntry> results;
    results.reserve(k);
    for (size_t i = 0; i < k; ++i) {
        if (indices[i] < 0) continue;
        size_t row = static_cast<size_t>(indices[i]);
        results.push_back({&entries_[row], row, scores[i]});
    }

    // FAISS does not promise an order among equal scores
    std::sort(results.begin(), results.end(), [](const ScoredEntry& a, const ScoredEntry& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.row < b.row;
    });
    return results;
}

} // namespace edubot

#pragma once
#include <string>
#include <vector>
#include <memory>
#include <stdexcept>
#include "cache_manager.hpp"
#include "KeyManager.hpp"
#include "ServiceMetrics.hpp"

namespace edubot {

struct AppConfig;

class EmbeddingError : public std::runtime_error {
public:
    explicit EmbeddingError(const std::string& what) : std::runtime_error(what) {}
};

// Truncates to at most `length` bytes without splitting a UTF-8 sequence.
std::string utf8_safe_substr(const std::string& str, size_t length);

/**
 * @brief Abstract text embedder used both at index-build time and at query time.
 */
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual std::vector<float> embed(const std::string& text) = 0;

    /**
     * @brief Embeds several texts; the result has one vector per input, in order.
     */
    virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts);

    virtual size_t dimension() const = 0;
    virtual std::string name() const = 0;
};

// Gemini text-embedding-004 over REST.
class GeminiEmbedder : public Embedder {
public:
    static constexpr size_t kDimension = 768;
    static constexpr size_t kMaxBatch = 100;
    // Longer inputs are cut before sending; the API rejects oversized parts.
    static constexpr size_t kMaxInputBytes = 8000;

    GeminiEmbedder(std::shared_ptr<KeyManager> key_manager, ServiceMetrics* metrics = nullptr);

    std::vector<float> embed(const std::string& text) override;
    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;

    size_t dimension() const override { return kDimension; }
    std::string name() const override { return "gemini"; }

private:
    std::shared_ptr<KeyManager> key_manager_;
    std::shared_ptr<CacheManager> cache_manager_;
    ServiceMetrics* metrics_;
    const std::string base_url_ = "https://generativelanguage.googleapis.com/v1beta/models/";

    std::string get_endpoint_url(const std::string& action) const;
};

/**
 * @brief Offline embedder: signed feature hashing of lower-cased alphanumeric tokens.
 *
 * Texts sharing words get a positive cosine similarity, so retrieval still behaves
 * sensibly without network access. Output is L2-normalized; an empty text maps to the
 * zero vector.
 */
class HashingEmbedder : public Embedder {
public:
    explicit HashingEmbedder(size_t dimension = 384);

    std::vector<float> embed(const std::string& text) override;

    size_t dimension() const override { return dimension_; }
    std::string name() const override { return "hashing"; }

    static std::vector<std::string> tokenize(const std::string& text);

private:
    size_t dimension_;
};

/**
 * @brief Selects the embedder named by config.embedding_backend.
 * @throws std::invalid_argument for an unknown backend.
 */
std::shared_ptr<Embedder> create_embedder(const AppConfig& config,
                                          std::shared_ptr<KeyManager> key_manager,
                                          ServiceMetrics* metrics);

} // namespace edubot

#include "embedding_service.hpp"
#include "app_config.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <thread>
#include <chrono>

namespace edubot {

using json = nlohmann::json;

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    // Back off while the cut would land on a continuation byte
    while (length > 0 && (static_cast<unsigned char>(str[length]) & 0xC0) == 0x80) {
        --length;
    }
    return str.substr(0, length);
}

std::vector<std::vector<float>> Embedder::embed_batch(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        out.push_back(embed(text));
    }
    return out;
}

// --- GEMINI ---

namespace {

template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory, const std::shared_ptr<KeyManager>& km) {
    const int max_retries = 4;
    cpr::Response r;
    for (int i = 0; i < max_retries; ++i) {
        r = request_factory();
        if (r.status_code == 200) return r;
        if ((r.status_code == 429 || r.status_code == 503) && km) {
            spdlog::warn("⚠️ Embedding API {} ({}). Rotating key and cooling down (attempt {}/{})",
                         r.status_code, (r.status_code == 429 ? "quota" : "overload"), i + 1, max_retries);
            km->report_rate_limit();
            std::this_thread::sleep_for(std::chrono::milliseconds(2000 + (i * 1000)));
            continue;
        }
        break;
    }
    return r;
}

json embed_request(const std::string& text) {
    return {
        {"model", "models/text-embedding-004"},
        {"content", {{"parts", {{{"text", utf8_safe_substr(text, GeminiEmbedder::kMaxInputBytes)}}}}}}
    };
}

} // namespace

GeminiEmbedder::GeminiEmbedder(std::shared_ptr<KeyManager> key_manager, ServiceMetrics* metrics)
    : key_manager_(std::move(key_manager)),
      cache_manager_(std::make_shared<CacheManager>()),
      metrics_(metrics) {}

std::string GeminiEmbedder::get_endpoint_url(const std::string& action) const {
    if (!key_manager_ || !key_manager_->has_keys()) {
        throw EmbeddingError("GEMINI_API_KEY not configured (set it, provide keys.json or use the hashing backend)");
    }
    return base_url_ + "text-embedding-004:" + action + "?key=" + key_manager_->get_current_key();
}

std::vector<float> GeminiEmbedder::embed(const std::string& text) {
    if (auto cached = cache_manager_->get_embedding(text)) return *cached;

    auto start = std::chrono::steady_clock::now();

    auto r = perform_request_with_retry([&]() {
        // Fresh URL per attempt so a rotated key is picked up
        return cpr::Post(cpr::Url{get_endpoint_url("embedContent")},
                         cpr::Body{embed_request(text).dump(-1, ' ', false, json::error_handler_t::replace)},
                         cpr::Header{{"Content-Type", "application/json"}});
    }, key_manager_);

    double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    if (metrics_) metrics_->embedding_latency_ms.store(duration);

    if (r.status_code != 200) {
        spdlog::error("❌ Embedding API error [{}]: {}", r.status_code, r.text);
        throw EmbeddingError("Failed to generate embedding (HTTP " + std::to_string(r.status_code) + ")");
    }

    std::vector<float> embedding;
    try {
        auto response_json = json::parse(r.text);
        embedding = response_json.at("embedding").at("values").get<std::vector<float>>();
    } catch (const json::exception& e) {
        throw EmbeddingError(std::string("Malformed embedding response: ") + e.what());
    }

    cache_manager_->set_embedding(text, embedding);
    return embedding;
}

std::vector<std::vector<float>> GeminiEmbedder::embed_batch(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(texts.size());

    for (size_t offset = 0; offset < texts.size(); offset += kMaxBatch) {
        size_t end = std::min(offset + kMaxBatch, texts.size());

        json requests = json::array();
        for (size_t i = offset; i < end; ++i) {
            requests.push_back(embed_request(texts[i]));
        }
        std::string payload = json{{"requests", requests}}.dump(-1, ' ', false, json::error_handler_t::replace);

        auto r = perform_request_with_retry([&]() {
            return cpr::Post(cpr::Url{get_endpoint_url("batchEmbedContents")},
                             cpr::Body{payload},
                             cpr::Header{{"Content-Type", "application/json"}});
        }, key_manager_);

        if (r.status_code != 200) {
            spdlog::error("❌ Batch embedding API error [{}]: {}", r.status_code, r.text);
            throw EmbeddingError("Failed to generate batch embeddings (HTTP " + std::to_string(r.status_code) + ")");
        }

        try {
            auto response_json = json::parse(r.text);
            for (const auto& emb : response_json.at("embeddings")) {
                embeddings.push_back(emb.at("values").get<std::vector<float>>());
            }
        } catch (const json::exception& e) {
            throw EmbeddingError(std::string("Malformed batch embedding response: ") + e.what());
        }

        spdlog::info("🧬 Embedded {}/{} texts", embeddings.size(), texts.size());
    }
    return embeddings;
}

// --- HASHING ---

HashingEmbedder::HashingEmbedder(size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw std::invalid_argument("HashingEmbedder dimension must be positive");
    }
}

std::vector<std::string> HashingEmbedder::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) {
            current += static_cast<char>(std::tolower(c));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

std::vector<float> HashingEmbedder::embed(const std::string& text) {
    std::vector<float> embedding(dimension_, 0.0f);
    std::hash<std::string> hasher;

    for (const auto& token : tokenize(text)) {
        size_t h = hasher(token);
        size_t bucket = h % dimension_;
        float sign = ((h >> 31) & 1u) ? -1.0f : 1.0f;
        embedding[bucket] += sign;
    }

    float norm = 0.0f;
    for (float v : embedding) norm += v * v;
    norm = std::sqrt(norm);
    if (norm > 0.0f) {
        for (float& v : embedding) v /= norm;
    }
    return embedding;
}

std::shared_ptr<Embedder> create_embedder(const AppConfig& config,
                                          std::shared_ptr<KeyManager> key_manager,
                                          ServiceMetrics* metrics) {
    if (config.embedding_backend == "gemini") {
        spdlog::info("🧬 Using Gemini embedder (text-embedding-004)");
        return std::make_shared<GeminiEmbedder>(std::move(key_manager), metrics);
    }
    if (config.embedding_backend == "hashing") {
        spdlog::info("🧬 Using local hashing embedder (dim={})", config.hashing_dimension);
        return std::make_shared<HashingEmbedder>(config.hashing_dimension);
    }
    throw std::invalid_argument("Unknown embedding backend: " + config.embedding_backend);
}

} // namespace edubot

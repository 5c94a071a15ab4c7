#pragma once

#include <string>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace edubot {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct AppConfig {
    std::string knowledge_base_path = "data/knowledge_base.json";

    // "gemini" or "hashing"
    std::string embedding_backend = "gemini";
    size_t hashing_dimension = 384;

    int default_top_k = 4;
    int max_top_k = 8;
    float confidence_threshold = 0.20f;
    size_t history_window = 6;
    // Unset: same-category candidates are preferred regardless of score.
    std::optional<float> category_preference_floor;

    size_t rate_limit = 10;
    int rate_window_seconds = 60;
    // Live chat sessions; the least recently used one is dropped past this.
    size_t max_sessions = 1000;

    std::string log_path = "logs/interactions.jsonl";
    std::string log_level = "info";

    std::string host = "127.0.0.1";
    int port = 5002;

    std::string generation_model = "gemini-2.5-flash-lite";
    std::string keys_path;

    /**
     * @brief Loads the config file. A missing file yields the defaults.
     * @throws ConfigError on malformed JSON, wrong value types or out-of-range values.
     */
    static AppConfig load(const std::string& path);

    static AppConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Clamp a requested top_k into [1, max_top_k]; <= 0 means "use the default".
    int clamp_top_k(int requested) const;
};

} // namespace edubot

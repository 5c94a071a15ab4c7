#include "app_config.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace edubot {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template<typename T>
void read_field(const json& j, const char* key, T& target) {
    if (!j.contains(key) || j[key].is_null()) return;
    try {
        target = j[key].get<T>();
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("Config key '") + key + "' has the wrong type: " + e.what());
    }
}

void validate(const AppConfig& cfg) {
    if (cfg.embedding_backend != "gemini" && cfg.embedding_backend != "hashing") {
        throw ConfigError("Unknown embedding_backend '" + cfg.embedding_backend + "'");
    }
    if (cfg.hashing_dimension == 0) {
        throw ConfigError("hashing_dimension must be positive");
    }
    if (cfg.max_top_k < 1) {
        throw ConfigError("max_top_k must be at least 1");
    }
    if (cfg.default_top_k < 1 || cfg.default_top_k > cfg.max_top_k) {
        throw ConfigError("default_top_k must be within [1, max_top_k]");
    }
    if (cfg.history_window == 0) {
        throw ConfigError("history_window must be positive");
    }
    if (cfg.rate_limit == 0 || cfg.rate_window_seconds <= 0) {
        throw ConfigError("rate_limit and rate_window_seconds must be positive");
    }
    if (cfg.max_sessions == 0) {
        throw ConfigError("max_sessions must be positive");
    }
    if (cfg.port <= 0 || cfg.port > 65535) {
        throw ConfigError("port out of range");
    }
}

} // namespace

AppConfig AppConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    AppConfig cfg;
    read_field(j, "knowledge_base_path", cfg.knowledge_base_path);
    read_field(j, "embedding_backend", cfg.embedding_backend);
    read_field(j, "hashing_dimension", cfg.hashing_dimension);
    read_field(j, "default_top_k", cfg.default_top_k);
    read_field(j, "max_top_k", cfg.max_top_k);
    read_field(j, "confidence_threshold", cfg.confidence_threshold);
    read_field(j, "history_window", cfg.history_window);
    read_field(j, "rate_limit", cfg.rate_limit);
    read_field(j, "rate_window_seconds", cfg.rate_window_seconds);
    read_field(j, "max_sessions", cfg.max_sessions);
    read_field(j, "log_path", cfg.log_path);
    read_field(j, "log_level", cfg.log_level);
    read_field(j, "host", cfg.host);
    read_field(j, "port", cfg.port);
    read_field(j, "generation_model", cfg.generation_model);
    read_field(j, "keys_path", cfg.keys_path);

    if (j.contains("category_preference_floor") && !j["category_preference_floor"].is_null()) {
        float floor = 0.0f;
        read_field(j, "category_preference_floor", floor);
        cfg.category_preference_floor = floor;
    }

    validate(cfg);
    return cfg;
}

AppConfig AppConfig::load(const std::string& path) {
    if (!fs::exists(path)) {
        spdlog::info("⚙️ No config at {}, using defaults", path);
        return AppConfig{};
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + path + ": " + e.what());
    }

    auto cfg = from_json(j);
    spdlog::info("⚙️ Config loaded from {} (backend: {}, top_k: {})", path, cfg.embedding_backend, cfg.default_top_k);
    return cfg;
}

json AppConfig::to_json() const {
    json j = {
        {"knowledge_base_path", knowledge_base_path},
        {"embedding_backend", embedding_backend},
        {"hashing_dimension", hashing_dimension},
        {"default_top_k", default_top_k},
        {"max_top_k", max_top_k},
        {"confidence_threshold", confidence_threshold},
        {"history_window", history_window},
        {"rate_limit", rate_limit},
        {"rate_window_seconds", rate_window_seconds},
        {"max_sessions", max_sessions},
        {"log_path", log_path},
        {"log_level", log_level},
        {"host", host},
        {"port", port},
        {"generation_model", generation_model}
    };
    if (category_preference_floor) {
        j["category_preference_floor"] = *category_preference_floor;
    } else {
        j["category_preference_floor"] = nullptr;
    }
    return j;
}

int AppConfig::clamp_top_k(int requested) const {
    if (requested <= 0) return default_top_k;
    return std::min(requested, max_top_k);
}

} // namespace edubot

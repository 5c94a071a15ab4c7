#pragma once
#include <vector>
#include <string>
#include <cstdlib>
#include <shared_mutex>
#include <nlohmann/json.hpp>
#include <fstream>
#include <spdlog/spdlog.h>

namespace edubot {

class KeyManager {
private:
    struct ApiKey {
        std::string key;
        bool is_active = true;
        int fail_count = 0;
    };

    std::vector<ApiKey> key_pool;
    mutable std::shared_mutex pool_mutex;
    size_t current_index = 0;
    std::string keys_path;

public:
    explicit KeyManager(std::string explicit_path = "") : keys_path(std::move(explicit_path)) {
        refresh_key_pool();
    }

    void refresh_key_pool() {
        std::unique_lock lock(pool_mutex);

        std::vector<std::string> search_paths;
        if (!keys_path.empty()) search_paths.push_back(keys_path);
        search_paths.insert(search_paths.end(), {
            "keys.json",
            "../keys.json",
            "build/keys.json",
            "../../keys.json"
        });

        std::ifstream f;
        std::string found_path;
        for (const auto& path : search_paths) {
            f.open(path);
            if (f.is_open()) {
                found_path = path;
                break;
            }
            f.clear();
        }

        key_pool.clear();
        current_index = 0;

        if (!found_path.empty()) {
            try {
                auto j = nlohmann::json::parse(f);
                for (auto& k : j.value("keys", nlohmann::json::array())) {
                    key_pool.push_back({k.get<std::string>(), true, 0});
                }
                spdlog::info("🔑 Key pool loaded from {}: {} Gemini keys", found_path, key_pool.size());
            } catch (const nlohmann::json::exception& e) {
                spdlog::error("💥 Failed to parse key file {}: {}", found_path, e.what());
                key_pool.clear();
            }
        }

        // Environment fallback
        if (key_pool.empty()) {
            const char* env_key = std::getenv("GEMINI_API_KEY");
            if (!env_key || !*env_key) env_key = std::getenv("GOOGLE_API_KEY");
            if (env_key && *env_key) {
                key_pool.push_back({env_key, true, 0});
                spdlog::info("🔑 Using Gemini key from environment");
            }
        }

        if (key_pool.empty()) {
            spdlog::warn("⚠️ No Gemini API key found (keys.json or GEMINI_API_KEY)");
        }
    }

    bool has_keys() const {
        std::shared_lock lock(pool_mutex);
        return !key_pool.empty();
    }

    size_t get_active_key_count() const {
        std::shared_lock lock(pool_mutex);
        size_t count = 0;
        for (const auto& k : key_pool) {
            if (k.is_active) count++;
        }
        return count;
    }

    std::string get_current_key() const {
        std::shared_lock lock(pool_mutex);
        if (key_pool.empty()) return "";
        return key_pool[current_index % key_pool.size()].key;
    }

    // Marks the current key as throttled and moves to the next active one.
    // When every key has been deactivated the whole pool gets a fresh start.
    void report_rate_limit() {
        std::unique_lock lock(pool_mutex);
        if (key_pool.empty()) return;

        auto& current = key_pool[current_index % key_pool.size()];
        current.fail_count++;
        if (current.fail_count > 2) {
            current.is_active = false;
            spdlog::warn("⚠️ Key #{} deactivated after repeated rate limits", current_index % key_pool.size());
        }

        for (size_t step = 1; step <= key_pool.size(); ++step) {
            size_t next = (current_index + step) % key_pool.size();
            if (key_pool[next].is_active) {
                current_index = next;
                return;
            }
        }

        spdlog::warn("⚠️ All {} keys rate limited; reactivating the pool", key_pool.size());
        for (auto& k : key_pool) {
            k.is_active = true;
            k.fail_count = 0;
        }
        current_index = (current_index + 1) % key_pool.size();
    }
};

} // namespace edubot

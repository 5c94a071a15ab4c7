#pragma once

#include <unordered_map>
#include <list>
#include <mutex>
#include <optional>
#include <vector>
#include <string>
#include <atomic>

namespace edubot {

// Thread-safe LRU map. Entries never expire; only capacity evicts.
template<typename Key, typename Value>
class LRUCache {
public:
    explicit LRUCache(size_t capacity) : capacity_(capacity) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) return std::nullopt;

        order_.splice(order_.begin(), order_, it->second);
        return it->second->second;
    }

    void put(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (capacity_ == 0) return;

        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            order_.splice(order_.begin(), order_, it->second);
            return;
        }

        if (index_.size() >= capacity_) {
            index_.erase(order_.back().first);
            order_.pop_back();
        }
        order_.emplace_front(key, std::move(value));
        index_[key] = order_.begin();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        index_.clear();
        order_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

private:
    using Node = std::pair<Key, Value>;

    size_t capacity_;
    std::list<Node> order_;
    std::unordered_map<Key, typename std::list<Node>::iterator> index_;
    mutable std::mutex mutex_;
};

// Query embeddings are requested repeatedly for the same text
// (quick questions, retries, the retrieve endpoint); cache them by exact text.
class CacheManager {
public:
    explicit CacheManager(size_t embedding_capacity = 1000)
        : embedding_cache_(embedding_capacity) {}

    std::optional<std::vector<float>> get_embedding(const std::string& text) {
        auto hit = embedding_cache_.get(text);
        if (hit) hits_++; else misses_++;
        return hit;
    }

    void set_embedding(const std::string& text, const std::vector<float>& embedding) {
        embedding_cache_.put(text, embedding);
    }

    size_t hits() const { return hits_.load(); }
    size_t misses() const { return misses_.load(); }

    void clear_all() {
        embedding_cache_.clear();
    }

private:
    LRUCache<std::string, std::vector<float>> embedding_cache_;
    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
};

} // namespace edubot

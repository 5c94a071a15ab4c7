#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "app_context.hpp"
#include "cache_manager.hpp"
#include "rag_types.hpp"

namespace edubot {

/**
 * @brief Fixed-window limiter: at most `limit` acquisitions per `window`.
 *
 * The window restarts at the first acquisition after it has elapsed.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    RateLimiter(size_t limit, std::chrono::seconds window);

    bool try_acquire(Clock::time_point now = Clock::now());
    size_t used() const { return count_; }
    size_t limit() const { return limit_; }

private:
    size_t limit_;
    std::chrono::seconds window_;
    size_t count_ = 0;
    Clock::time_point window_start_;
    bool started_ = false;
};

enum class ReplyKind {
    Answer,
    Clarification,
    Blocked,
    RateLimited,
    EmptyQuery,
    Error
};

std::string to_string(ReplyKind kind);

// Strips surrounding whitespace; an empty result means there is nothing to answer.
std::string trim_query(const std::string& raw);

struct SourceRef {
    std::string title;
    std::string category;
    float score = 0.0f;
};

struct ChatReply {
    ReplyKind kind = ReplyKind::Answer;
    std::string text;
    std::string intent;
    std::vector<SourceRef> sources;
    size_t chunk_count = 0;
    size_t top_k = 0;
    double latency_s = 0.0;
    double retrieval_ms = 0.0;
};

/**
 * @brief One learner's conversation: safety, retrieval, gating, context and generation.
 *
 * Requests on one session are serialized; different sessions run concurrently
 * against the shared index.
 */
class ChatSession {
public:
    ChatSession(AppContext& context, std::string session_id);

    // top_k <= 0 uses the configured default; larger values are clamped to max_top_k.
    ChatReply ask(const std::string& query, int top_k = 0);

    void clear();

    std::vector<ConversationTurn> history() const;
    size_t turn_count() const;
    const std::string& id() const { return session_id_; }

private:
    AppContext& context_;
    std::string session_id_;
    std::vector<ConversationTurn> history_;
    RateLimiter limiter_;
    mutable std::mutex mtx_;

    void append_assistant(const std::string& text);
};

/**
 * @brief Session id -> ChatSession, bounded by `max_sessions`.
 *
 * The least recently used session is evicted once the bound is reached. A handler
 * still holding an evicted session keeps it alive until the request finishes.
 */
class SessionRegistry {
public:
    explicit SessionRegistry(AppContext& context);

    std::shared_ptr<ChatSession> get_or_create(const std::string& session_id);
    bool clear(const std::string& session_id);
    size_t size() const;
    size_t capacity() const { return capacity_; }

    static std::string new_session_id();

private:
    AppContext& context_;
    size_t capacity_;
    LRUCache<std::string, std::shared_ptr<ChatSession>> sessions_;
    std::mutex create_mtx_;
};

} // namespace edubot

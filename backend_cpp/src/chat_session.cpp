#include "chat_session.hpp"
#include "confidence_gate.hpp"
#include "context_assembler.hpp"
#include "generator_service.hpp"
#include "InteractionLogger.hpp"
#include "safety_filter.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>
#include <spdlog/spdlog.h>

namespace edubot {

// --- RATE LIMITER ---

RateLimiter::RateLimiter(size_t limit, std::chrono::seconds window)
    : limit_(limit), window_(window) {}

bool RateLimiter::try_acquire(Clock::time_point now) {
    if (!started_ || now - window_start_ > window_) {
        started_ = true;
        window_start_ = now;
        count_ = 0;
    }
    if (count_ >= limit_) return false;
    count_++;
    return true;
}

std::string to_string(ReplyKind kind) {
    switch (kind) {
        case ReplyKind::Answer: return "answer";
        case ReplyKind::Clarification: return "clarification";
        case ReplyKind::Blocked: return "blocked";
        case ReplyKind::RateLimited: return "rate_limited";
        case ReplyKind::EmptyQuery: return "empty_query";
        case ReplyKind::Error: return "error";
    }
    return "error";
}

std::string trim_query(const std::string& raw) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(raw.begin(), raw.end(), not_space);
    auto end = std::find_if(raw.rbegin(), raw.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

// --- SESSION ---

ChatSession::ChatSession(AppContext& context, std::string session_id)
    : context_(context),
      session_id_(std::move(session_id)),
      limiter_(context.config().rate_limit, std::chrono::seconds(context.config().rate_window_seconds)) {}

void ChatSession::append_assistant(const std::string& text) {
    history_.push_back({Role::Assistant, text});
}

ChatReply ChatSession::ask(const std::string& raw_query, int top_k) {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto& cfg = context_.config();
    auto& metrics = context_.metrics();

    ChatReply reply;
    reply.top_k = static_cast<size_t>(cfg.clamp_top_k(top_k));

    const std::string query = trim_query(raw_query);
    if (query.empty()) {
        reply.kind = ReplyKind::EmptyQuery;
        return reply;
    }

    // Checked before the turn is recorded so a refused request leaves no dangling user turn
    if (!limiter_.try_acquire()) {
        metrics.rate_limited++;
        reply.kind = ReplyKind::RateLimited;
        reply.text = "Rate limit reached (" + std::to_string(limiter_.limit()) + "/" +
                     std::to_string(cfg.rate_window_seconds) + "s). Please wait.";
        spdlog::warn("⏳ Session {} rate limited", session_id_);
        return reply;
    }

    history_.push_back({Role::User, query});

    // --- BLOCKED ---
    if (is_blocked(query)) {
        reply.kind = ReplyKind::Blocked;
        reply.intent = "blocked";
        reply.text = kSafeResponse;
        append_assistant(reply.text);
        metrics.blocked++;
        context_.logger().log(make_record(session_id_, query, "blocked", {}, 0.0, true, reply.text));
        spdlog::info("🛡️ Blocked assessment-solving request (session {})", session_id_);
        return reply;
    }

    reply.intent = classify_intent(query);

    // --- STEP 1: RETRIEVE ---
    std::vector<RetrievedChunk> chunks;
    try {
        auto t0 = std::chrono::steady_clock::now();
        auto engine = context_.retrieval_engine();
        chunks = engine.retrieve(query, reply.intent, reply.top_k);
        reply.retrieval_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    } catch (const std::exception& e) {
        spdlog::error("❌ Retrieval failed: {}", e.what());
        reply.kind = ReplyKind::Error;
        reply.text = std::string("Error retrieving knowledge base content: ") + e.what();
        append_assistant(reply.text);
        return reply;
    }

    // --- STEP 2: GATE ---
    if (needs_clarification(chunks, cfg.confidence_threshold)) {
        reply.kind = ReplyKind::Clarification;
        reply.text = kClarificationResponse;
        append_assistant(reply.text);
        metrics.clarifications++;
        context_.logger().log(make_record(session_id_, query, reply.intent, {}, 0.0, false, reply.text));
        spdlog::info("❓ Low confidence (best {:.3f}), asking for clarification",
                     chunks.empty() ? 0.0f : chunks.front().score);
        return reply;
    }

    // --- STEP 3: CONTEXT + GENERATION ---
    auto messages = build_context(query, chunks, history_, reply.intent, reply.top_k, cfg.history_window);

    try {
        auto result = context_.generator().generate(messages);
        reply.kind = ReplyKind::Answer;
        reply.text = result.text;
        reply.latency_s = result.latency_s;
    } catch (const std::exception& e) {
        spdlog::error("❌ Generation error: {}", e.what());
        metrics.generation_errors++;
        reply.kind = ReplyKind::Error;
        reply.text = std::string("⚠️ Error calling Gemini API: ") + e.what() + "\n\nPlease check your API key.";
        append_assistant(reply.text);
        return reply;
    }

    std::vector<std::string> titles;
    for (const auto& c : chunks) {
        reply.sources.push_back({c.title, to_string(c.category), c.score});
        titles.push_back(c.title);
    }
    reply.chunk_count = chunks.size();

    append_assistant(reply.text);
    metrics.answers++;
    context_.logger().log(make_record(session_id_, query, reply.intent, titles, reply.latency_s, false, reply.text));
    return reply;
}

void ChatSession::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    history_.clear();
}

std::vector<ConversationTurn> ChatSession::history() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return history_;
}

size_t ChatSession::turn_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return static_cast<size_t>(std::count_if(history_.begin(), history_.end(),
        [](const ConversationTurn& t) { return t.role == Role::User; }));
}

// --- REGISTRY ---

SessionRegistry::SessionRegistry(AppContext& context)
    : context_(context),
      capacity_(context.config().max_sessions),
      sessions_(context.config().max_sessions) {}

std::shared_ptr<ChatSession> SessionRegistry::get_or_create(const std::string& session_id) {
    // Lookup and insert must not interleave, or two requests could each create the session
    std::lock_guard<std::mutex> lock(create_mtx_);
    if (auto existing = sessions_.get(session_id)) {
        return *existing;
    }

    if (sessions_.size() >= capacity_) {
        spdlog::info("🧹 Session limit ({}) reached, evicting the least recently used", capacity_);
    }
    auto session = std::make_shared<ChatSession>(context_, session_id);
    sessions_.put(session_id, session);
    spdlog::info("💬 New session {}", session_id.substr(0, 8));
    return session;
}

bool SessionRegistry::clear(const std::string& session_id) {
    auto session = sessions_.get(session_id);
    if (!session) return false;
    (*session)->clear();
    return true;
}

size_t SessionRegistry::size() const {
    return sessions_.size();
}

std::string SessionRegistry::new_session_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(16) << rng() << std::setw(16) << rng();
    return ss.str();
}

} // namespace edubot

#pragma once
#include <deque>
#include <mutex>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

namespace edubot {

// Anonymized: no raw query, no raw session id.
struct InteractionRecord {
    std::string timestamp;      // UTC, ISO-8601 with trailing Z
    std::string user_hash;
    size_t query_length = 0;
    std::string intent;
    std::vector<std::string> retrieved_docs;
    double latency_seconds = 0.0;
    bool safety_triggered = false;
    size_t response_preview_length = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief 16 hex chars standing in for the session id in logged records.
 *
 * Built from salted std::hash values: not a cryptographic or one-way hash, and the
 * value is only stable within one build of the standard library. It keeps raw ids
 * out of the log file; it does not protect them from someone who can enumerate ids.
 */
std::string anonymize_session(const std::string& session_id);
std::string utc_timestamp_now();

InteractionRecord make_record(const std::string& session_id,
                              const std::string& query,
                              const std::string& intent,
                              const std::vector<std::string>& retrieved_titles,
                              double latency_seconds,
                              bool safety_triggered,
                              const std::string& response);

/**
 * @brief Fire-and-forget interaction sink.
 *
 * Appends JSON lines to a file and keeps the most recent records in memory for the
 * telemetry endpoint. Write failures are logged, never thrown.
 */
class InteractionLogger {
public:
    static constexpr size_t kRecentCapacity = 50;

    // An empty path keeps records in memory only.
    explicit InteractionLogger(std::string log_path);

    void log(const InteractionRecord& record);

    // Newest first
    nlohmann::json recent_json() const;
    size_t recent_count() const;

private:
    std::string log_path_;
    std::deque<InteractionRecord> recent_;
    mutable std::mutex mtx_;
};

} // namespace edubot

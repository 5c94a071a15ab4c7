#include "InteractionLogger.hpp"
#include <chrono>
#include <cstdint>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <sstream>
#include <spdlog/spdlog.h>

namespace edubot {

namespace fs = std::filesystem;
using json = nlohmann::json;

json InteractionRecord::to_json() const {
    return {
        {"timestamp", timestamp},
        {"user_hash", user_hash},
        {"query_length", query_length},
        {"intent", intent},
        {"retrieved_docs", retrieved_docs},
        {"latency_seconds", std::round(latency_seconds * 1000.0) / 1000.0},
        {"safety_triggered", safety_triggered},
        {"response_preview_length", response_preview_length}
    };
}

std::string anonymize_session(const std::string& session_id) {
    // Two differently salted hashes give 16 hex chars
    std::hash<std::string> hasher;
    uint64_t a = static_cast<uint64_t>(hasher("edubot:" + session_id));
    uint64_t b = static_cast<uint64_t>(hasher(session_id + ":edubot"));
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(8) << (a & 0xffffffffULL)
       << std::setw(8) << (b & 0xffffffffULL);
    return ss.str();
}

std::string utc_timestamp_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "."
       << std::setfill('0') << std::setw(6) << micros << "Z";
    return ss.str();
}

InteractionRecord make_record(const std::string& session_id,
                              const std::string& query,
                              const std::string& intent,
                              const std::vector<std::string>& retrieved_titles,
                              double latency_seconds,
                              bool safety_triggered,
                              const std::string& response) {
    InteractionRecord record;
    record.timestamp = utc_timestamp_now();
    record.user_hash = anonymize_session(session_id);
    record.query_length = query.size();
    record.intent = intent;
    record.retrieved_docs = retrieved_titles;
    record.latency_seconds = latency_seconds;
    record.safety_triggered = safety_triggered;
    record.response_preview_length = response.size();
    return record;
}

InteractionLogger::InteractionLogger(std::string log_path) : log_path_(std::move(log_path)) {}

void InteractionLogger::log(const InteractionRecord& record) {
    std::lock_guard<std::mutex> lock(mtx_);

    recent_.push_back(record);
    if (recent_.size() > kRecentCapacity) {
        recent_.pop_front();
    }

    if (log_path_.empty()) return;

    std::error_code ec;
    fs::path parent = fs::path(log_path_).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);
    if (ec) {
        spdlog::warn("⚠️ Interaction log directory {} unavailable: {}", parent.string(), ec.message());
        return;
    }

    std::ofstream out(log_path_, std::ios::app);
    if (!out) {
        spdlog::warn("⚠️ Cannot append to interaction log {}", log_path_);
        return;
    }
    out << record.to_json().dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
}

json InteractionLogger::recent_json() const {
    std::lock_guard<std::mutex> lock(mtx_);
    json list = json::array();
    for (auto it = recent_.rbegin(); it != recent_.rend(); ++it) {
        list.push_back(it->to_json());
    }
    return list;
}

size_t InteractionLogger::recent_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return recent_.size();
}

} // namespace edubot

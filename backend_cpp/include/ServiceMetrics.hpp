#pragma once
#include <atomic>
#include <cstddef>

namespace edubot {

struct TelemetryData {
    // Latency of the most recent operation of each kind
    double retrieval_latency_ms = 0.0;
    double embedding_latency_ms = 0.0;
    double generation_latency_ms = 0.0;

    size_t last_candidate_pool = 0;

    // Request outcomes since start
    size_t answers = 0;
    size_t clarifications = 0;
    size_t blocked = 0;
    size_t rate_limited = 0;
    size_t generation_errors = 0;
};

class ServiceMetrics {
public:
    std::atomic<double> retrieval_latency_ms{0.0};
    std::atomic<double> embedding_latency_ms{0.0};
    std::atomic<double> generation_latency_ms{0.0};
    std::atomic<size_t> last_candidate_pool{0};

    std::atomic<size_t> answers{0};
    std::atomic<size_t> clarifications{0};
    std::atomic<size_t> blocked{0};
    std::atomic<size_t> rate_limited{0};
    std::atomic<size_t> generation_errors{0};

    TelemetryData get_latest_snapshot() const {
        TelemetryData data;
        data.retrieval_latency_ms = retrieval_latency_ms.load();
        data.embedding_latency_ms = embedding_latency_ms.load();
        data.generation_latency_ms = generation_latency_ms.load();
        data.last_candidate_pool = last_candidate_pool.load();
        data.answers = answers.load();
        data.clarifications = clarifications.load();
        data.blocked = blocked.load();
        data.rate_limited = rate_limited.load();
        data.generation_errors = generation_errors.load();
        return data;
    }
};

} // namespace edubot

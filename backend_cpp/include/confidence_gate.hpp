#pragma once
#include <vector>
#include "rag_types.hpp"

namespace edubot {

constexpr float kConfidenceThreshold = 0.20f;

extern const char* const kClarificationResponse;

// True when there is nothing to answer from, or the best score is strictly below threshold.
// Only the top score counts; a weak tail behind a strong hit does not trigger clarification.
bool needs_clarification(const std::vector<RetrievedChunk>& ranked_chunks,
                         float threshold = kConfidenceThreshold);

} // namespace edubot

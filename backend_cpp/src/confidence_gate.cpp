#include "confidence_gate.hpp"
#include <algorithm>

namespace edubot {

const char* const kClarificationResponse =
    "I want to make sure I give you the most accurate answer. "
    "Could you clarify: are you asking about:\n"
    "- **Quizzes** (short graded tests within modules)\n"
    "- **Assignments** (submitted project work)\n"
    "- **Final Exams** (end-of-course certification exams)\n"
    "- **Progress Tracking** (dashboard and completion metrics)\n\n"
    "That will help me explain the right process for you!";

bool needs_clarification(const std::vector<RetrievedChunk>& ranked_chunks, float threshold) {
    if (ranked_chunks.empty()) return true;

    auto best = std::max_element(ranked_chunks.begin(), ranked_chunks.end(),
        [](const RetrievedChunk& a, const RetrievedChunk& b) { return a.score < b.score; });
    return best->score < threshold;
}

} // namespace edubot

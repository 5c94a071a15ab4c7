#pragma once
#include <string>

namespace edubot {

extern const char* const kSafeResponse;

// Assessment-solving requests (answers to quizzes, exams, MCQs, fill-in-the-blank, cheating).
bool is_blocked(const std::string& query);

// "blocked", "course", "assessment", "certification", "progress" or "general".
// Keyword families are checked in that order; the first match wins.
std::string classify_intent(const std::string& query);

} // namespace edubot

#pragma once
#include <vector>
#include "rag_types.hpp"

namespace edubot {

constexpr size_t kDefaultHistoryWindow = 6;

/**
 * @brief The last max_turns entries of history, in their original order.
 *
 * History shorter than max_turns is returned whole. The input is never modified.
 */
std::vector<ConversationTurn> window(const std::vector<ConversationTurn>& history, size_t max_turns);

/**
 * @brief Window over the turns before the in-flight query.
 *
 * The session appends the current user turn before building context; that turn is
 * re-sent inside the augmented message, so a trailing user turn is dropped here
 * before windowing.
 */
std::vector<ConversationTurn> prior_window(const std::vector<ConversationTurn>& history, size_t max_turns);

} // namespace edubot

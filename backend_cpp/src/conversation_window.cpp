#include "conversation_window.hpp"

namespace edubot {

namespace {

std::vector<ConversationTurn> tail(std::vector<ConversationTurn>::const_iterator begin,
                                   std::vector<ConversationTurn>::const_iterator end,
                                   size_t max_turns) {
    size_t available = static_cast<size_t>(end - begin);
    if (available > max_turns) {
        begin = end - static_cast<std::ptrdiff_t>(max_turns);
    }
    return std::vector<ConversationTurn>(begin, end);
}

} // namespace

std::vector<ConversationTurn> window(const std::vector<ConversationTurn>& history, size_t max_turns) {
    return tail(history.begin(), history.end(), max_turns);
}

std::vector<ConversationTurn> prior_window(const std::vector<ConversationTurn>& history, size_t max_turns) {
    auto end = history.end();
    if (!history.empty() && history.back().role == Role::User) {
        --end;
    }
    return tail(history.begin(), end, max_turns);
}

} // namespace edubot

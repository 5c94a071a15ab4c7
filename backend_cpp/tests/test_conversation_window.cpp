#include <gtest/gtest.h>
#include "conversation_window.hpp"

using namespace edubot;

namespace {

// Alternating user/assistant turns "t0", "t1", ...
std::vector<ConversationTurn> alternating(size_t n) {
    std::vector<ConversationTurn> turns;
    for (size_t i = 0; i < n; ++i) {
        turns.push_back({i % 2 == 0 ? Role::User : Role::Assistant, "t" + std::to_string(i)});
    }
    return turns;
}

std::vector<std::string> contents(const std::vector<ConversationTurn>& turns) {
    std::vector<std::string> out;
    for (const auto& t : turns) out.push_back(t.content);
    return out;
}

} // namespace

TEST(ConversationWindowTest, KeepsLastTurnsInOrder) {
    auto w = window(alternating(14), 12);
    ASSERT_EQ(w.size(), 12u);
    EXPECT_EQ(w.front().content, "t2");
    EXPECT_EQ(w.back().content, "t13");
    for (size_t i = 0; i < w.size(); ++i) {
        EXPECT_EQ(w[i].content, "t" + std::to_string(i + 2));
    }
}

TEST(ConversationWindowTest, ShortHistoryIsReturnedWhole) {
    auto history = alternating(3);
    EXPECT_EQ(contents(window(history, 6)), contents(history));
    EXPECT_EQ(contents(window(history, 3)), contents(history));
    EXPECT_TRUE(window({}, 6).empty());
    EXPECT_TRUE(window(history, 0).empty());
}

TEST(ConversationWindowTest, InputIsNotModified) {
    auto history = alternating(10);
    auto copy = history;
    window(history, 4);
    prior_window(history, 4);
    EXPECT_EQ(contents(history), contents(copy));
}

TEST(PriorWindowTest, ExcludesInFlightUserTurn) {
    // t0..t6: t6 is the user turn being answered
    auto history = alternating(7);
    auto w = prior_window(history, 6);
    EXPECT_EQ(contents(w), (std::vector<std::string>{"t0", "t1", "t2", "t3", "t4", "t5"}));
}

TEST(PriorWindowTest, WindowAppliesAfterDroppingCurrentTurn) {
    auto history = alternating(9);   // t8 is in flight
    auto w = prior_window(history, 6);
    EXPECT_EQ(contents(w), (std::vector<std::string>{"t2", "t3", "t4", "t5", "t6", "t7"}));
}

TEST(PriorWindowTest, FirstQuestionHasNoPriorTurns) {
    EXPECT_TRUE(prior_window(alternating(1), 6).empty());
    EXPECT_TRUE(prior_window({}, 6).empty());
}

TEST(PriorWindowTest, TrailingAssistantTurnIsKept) {
    auto history = alternating(4);   // ends with assistant t3
    auto w = prior_window(history, 2);
    EXPECT_EQ(contents(w), (std::vector<std::string>{"t2", "t3"}));
}

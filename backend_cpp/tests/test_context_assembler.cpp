#include <gtest/gtest.h>
#include "context_assembler.hpp"
#include "test_helpers.hpp"

using namespace edubot;
using edubot::test_support::make_chunk;

TEST(ContextAssemblerTest, HeaderStatesCountsAndHint) {
    std::vector<RetrievedChunk> chunks = {
        make_chunk("a", Category::Assessment, 0.8123f),
        make_chunk("b", Category::Course, 0.4f)
    };
    auto msg = render_augmented_message("How many attempts?", chunks, "assessment", 4);

    EXPECT_EQ(msg.rfind("[RETRIEVAL chunks=2 top_k=4 category=assessment]\n", 0), 0u);
    EXPECT_NE(msg.find("KNOWLEDGE BASE CONTEXT (2 chunks retrieved, ranked by relevance):"), std::string::npos);
    EXPECT_NE(msg.find("[CHUNK 1 | Category: ASSESSMENT | Title: Title a | Relevance: 0.812]\nContent a\n"),
              std::string::npos);
    EXPECT_NE(msg.find("\n---\n\n[CHUNK 2 | Category: COURSE | Title: Title b | Relevance: 0.400]"),
              std::string::npos);
    EXPECT_NE(msg.find("USER QUESTION: How many attempts?"), std::string::npos);
    EXPECT_NE(msg.find("Synthesize information from ALL 2 chunks"), std::string::npos);
}

TEST(ContextAssemblerTest, MissingHintIsNone) {
    auto msg = render_augmented_message("hi", {make_chunk("a", Category::Course, 0.5f)}, "", 3);
    EXPECT_EQ(msg.rfind("[RETRIEVAL chunks=1 top_k=3 category=none]", 0), 0u);
}

TEST(ContextAssemblerTest, EmptyRetrievalUsesNoContentNote) {
    auto msg = render_augmented_message("What is a nanodegree?", {}, "course", 4);
    EXPECT_EQ(msg.rfind("[RETRIEVAL chunks=0 top_k=4 category=course]", 0), 0u);
    EXPECT_NE(msg.find("No specific context found in knowledge base."), std::string::npos);
    EXPECT_NE(msg.find("NOTE:"), std::string::npos);
    EXPECT_EQ(msg.find("INSTRUCTIONS:"), std::string::npos);
    EXPECT_EQ(msg.find("[CHUNK"), std::string::npos);
}

TEST(ContextAssemblerTest, QueryIsCarriedVerbatim) {
    std::string query = "  What's the {policy} for re-takes?\n";
    auto msg = render_augmented_message(query, {}, "", 1);
    EXPECT_NE(msg.find("USER QUESTION: " + query), std::string::npos);
}

TEST(ContextAssemblerTest, WindowTurnsPrecedeAugmentedMessage) {
    std::vector<ConversationTurn> window = {
        {Role::User, "How do quizzes work?"},
        {Role::Assistant, "Quizzes are short graded tests."}
    };
    auto messages = assemble("And exams?", {make_chunk("a", Category::Assessment, 0.7f)}, window, "assessment", 4);

    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].role, PromptRole::User);
    EXPECT_EQ(messages[0].content, "How do quizzes work?");
    EXPECT_EQ(messages[1].role, PromptRole::Model);
    EXPECT_EQ(to_string(messages[1].role), "model");
    EXPECT_EQ(messages[2].role, PromptRole::User);
    EXPECT_NE(messages[2].content.find("USER QUESTION: And exams?"), std::string::npos);
}

TEST(ContextAssemblerTest, BuildContextDoesNotRepeatCurrentQuestion) {
    std::vector<ConversationTurn> history = {
        {Role::User, "How do quizzes work?"},
        {Role::Assistant, "Quizzes are short graded tests."},
        {Role::User, "And exams?"}
    };
    auto messages = build_context("And exams?", {}, history, "", 4, 6);

    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[1].content, "Quizzes are short graded tests.");
    for (size_t i = 0; i + 1 < messages.size(); ++i) {
        EXPECT_NE(messages[i].content, "And exams?");
    }
}

TEST(ContextAssemblerTest, SystemPromptForbidsSolvingAssessments) {
    std::string prompt = kSystemPrompt;
    EXPECT_NE(prompt.find("NEVER provide answers to quizzes"), std::string::npos);
}

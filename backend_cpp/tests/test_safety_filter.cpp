#include <gtest/gtest.h>
#include "safety_filter.hpp"

using namespace edubot;

TEST(SafetyFilterTest, BlocksAssessmentSolvingRequests) {
    const char* blocked[] = {
        "Can you solve this quiz question for me?",
        "What is the correct answer to question 3?",
        "Give me the answers for module 2",
        "answer q4 please",
        "Fill in the blank: the mitochondria is ___",
        "Which option is correct here?",
        "how can I cheat on the final",
        "Complete the following sentence",
        "SOLVE THIS please"
    };
    for (const char* q : blocked) {
        EXPECT_TRUE(is_blocked(q)) << q;
        EXPECT_EQ(classify_intent(q), "blocked") << q;
    }
}

TEST(SafetyFilterTest, AllowsQuestionsAboutHowThingsWork) {
    const char* allowed[] = {
        "How many attempts do I get on the final exam?",
        "How do I enroll in a course?",
        "Where can I download my certificate?",
        "How is my progress calculated?"
    };
    for (const char* q : allowed) {
        EXPECT_FALSE(is_blocked(q)) << q;
    }
}

TEST(SafetyFilterTest, ClassifiesByFirstMatchingFamily) {
    EXPECT_EQ(classify_intent("How do I enroll?"), "course");
    EXPECT_EQ(classify_intent("When is my quiz due?"), "assessment");
    EXPECT_EQ(classify_intent("Can employers verify my certificate?"), "certification");
    EXPECT_EQ(classify_intent("Where is my dashboard streak?"), "progress");
    EXPECT_EQ(classify_intent("Hello there"), "general");
    // "course" is checked before "assessment"
    EXPECT_EQ(classify_intent("Does the course have an exam?"), "course");
}

TEST(SafetyFilterTest, SafeResponseMentionsIntegrity) {
    EXPECT_NE(std::string(kSafeResponse).find("academic integrity"), std::string::npos);
}

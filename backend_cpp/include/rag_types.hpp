#pragma once
#include <string>
#include <vector>
#include "knowledge_base.hpp"

namespace edubot {

// One ranked hit for one query. Copied out of the index, never shared with it.
struct RetrievedChunk {
    std::string id;
    std::string title;
    Category category = Category::Course;
    std::string content;
    std::vector<std::string> tags;
    float score = 0.0f; // cosine similarity, [-1, 1]
    size_t row = 0;     // corpus position; breaks score ties
};

enum class Role {
    User,
    Assistant
};

struct ConversationTurn {
    Role role = Role::User;
    std::string content;
};

// The generator's role vocabulary.
enum class PromptRole {
    User,
    Model
};

struct PromptMessage {
    PromptRole role = PromptRole::User;
    std::string content;
};

inline std::string to_string(PromptRole role) {
    return role == PromptRole::Model ? "model" : "user";
}

inline std::string to_string(Role role) {
    return role == Role::Assistant ? "assistant" : "user";
}

} // namespace edubot

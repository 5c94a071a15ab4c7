#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace edubot {

enum class Category {
    Course,
    Assessment,
    Certification,
    Progress
};

// Exact lowercase match; "general", "blocked" and "" have no category.
std::optional<Category> category_from_string(const std::string& text);
std::string to_string(Category category);

struct CorpusEntry {
    std::string id;
    std::string title;
    Category category = Category::Course;
    std::string content;
    std::vector<std::string> tags;

    nlohmann::json to_json() const;
};

struct KnowledgeBaseStats {
    size_t total_entries = 0;
    std::map<std::string, size_t> by_category;
};

class KnowledgeBaseError : public std::runtime_error {
public:
    explicit KnowledgeBaseError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Reads and validates the corpus file (a JSON array of entries).
 * @throws KnowledgeBaseError on a missing file, invalid JSON or any schema violation.
 */
std::vector<CorpusEntry> load_knowledge_base(const std::string& path);

/**
 * @brief Validates an already parsed corpus document. Never returns a partial corpus.
 * @throws KnowledgeBaseError
 */
std::vector<CorpusEntry> parse_knowledge_base(const nlohmann::json& document);

KnowledgeBaseStats compute_stats(const std::vector<CorpusEntry>& entries);

// "<title>. Tags: <a>, <b>. <content>"
std::string compose_embedding_text(const CorpusEntry& entry);

} // namespace edubot

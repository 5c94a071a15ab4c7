#include "knowledge_base.hpp"
#include <filesystem>
#include <fstream>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace edubot {

namespace fs = std::filesystem;
using json = nlohmann::json;

std::optional<Category> category_from_string(const std::string& text) {
    if (text == "course") return Category::Course;
    if (text == "assessment") return Category::Assessment;
    if (text == "certification") return Category::Certification;
    if (text == "progress") return Category::Progress;
    return std::nullopt;
}

std::string to_string(Category category) {
    switch (category) {
        case Category::Course: return "course";
        case Category::Assessment: return "assessment";
        case Category::Certification: return "certification";
        case Category::Progress: return "progress";
    }
    return "course";
}

json CorpusEntry::to_json() const {
    return {
        {"id", id},
        {"title", title},
        {"category", to_string(category)},
        {"content", content},
        {"tags", tags}
    };
}

namespace {

std::string required_string(const json& j, const char* key, size_t position) {
    if (!j.contains(key) || !j[key].is_string()) {
        throw KnowledgeBaseError("Entry #" + std::to_string(position) +
                                 ": missing or non-string field '" + key + "'");
    }
    return j[key].get<std::string>();
}

CorpusEntry entry_from_json(const json& j, size_t position) {
    if (!j.is_object()) {
        throw KnowledgeBaseError("Entry #" + std::to_string(position) + " is not an object");
    }

    CorpusEntry entry;
    entry.id = required_string(j, "id", position);
    entry.title = required_string(j, "title", position);
    entry.content = required_string(j, "content", position);

    std::string category = required_string(j, "category", position);
    auto parsed = category_from_string(category);
    if (!parsed) {
        throw KnowledgeBaseError("Entry '" + entry.id + "': unknown category '" + category + "'");
    }
    entry.category = *parsed;

    if (j.contains("tags") && !j["tags"].is_null()) {
        if (!j["tags"].is_array()) {
            throw KnowledgeBaseError("Entry '" + entry.id + "': tags must be an array");
        }
        for (const auto& tag : j["tags"]) {
            if (!tag.is_string()) {
                throw KnowledgeBaseError("Entry '" + entry.id + "': tags must be strings");
            }
            entry.tags.push_back(tag.get<std::string>());
        }
    }
    return entry;
}

} // namespace

std::vector<CorpusEntry> parse_knowledge_base(const json& document) {
    if (!document.is_array()) {
        throw KnowledgeBaseError("Knowledge base must be a JSON array of entries");
    }
    if (document.empty()) {
        throw KnowledgeBaseError("Knowledge base is empty");
    }

    std::vector<CorpusEntry> entries;
    entries.reserve(document.size());
    std::unordered_set<std::string> seen_ids;

    for (size_t i = 0; i < document.size(); ++i) {
        CorpusEntry entry = entry_from_json(document[i], i);
        if (!seen_ids.insert(entry.id).second) {
            throw KnowledgeBaseError("Duplicate entry id '" + entry.id + "'");
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::vector<CorpusEntry> load_knowledge_base(const std::string& path) {
    if (!fs::exists(path)) {
        throw KnowledgeBaseError("Knowledge base not found: " + path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw KnowledgeBaseError("Cannot open knowledge base: " + path);
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw KnowledgeBaseError("Invalid JSON in " + path + ": " + e.what());
    }

    auto entries = parse_knowledge_base(document);
    spdlog::info("📚 Loaded {} knowledge base entries from {}", entries.size(), path);
    return entries;
}

KnowledgeBaseStats compute_stats(const std::vector<CorpusEntry>& entries) {
    KnowledgeBaseStats stats;
    stats.total_entries = entries.size();
    for (const auto& entry : entries) {
        stats.by_category[to_string(entry.category)]++;
    }
    return stats;
}

std::string compose_embedding_text(const CorpusEntry& entry) {
    std::string tags;
    for (size_t i = 0; i < entry.tags.size(); ++i) {
        if (i > 0) tags += ", ";
        tags += entry.tags[i];
    }
    return entry.title + ". Tags: " + tags + ". " + entry.content;
}

} // namespace edubot

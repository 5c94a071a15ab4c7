#include "generator_service.hpp"
#include "context_assembler.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <regex>
#include <thread>

namespace edubot {

using json = nlohmann::json;

const char* const kLeakageBlockResponse =
    "I noticed my response might have included assessment-specific information "
    "that I should not share. I've blocked that response to maintain academic integrity.\n\n"
    "I can still help you understand **how assessments work** on our platform. "
    "Would you like me to explain the assessment format or grading policy instead?";

ValidationResult validate_response(const std::string& response_text) {
    static const std::vector<std::regex> leakage_patterns = [] {
        const char* sources[] = {
            R"(\bthe (correct|right) answer is\b)",
            R"(\boption [a-d] is correct\b)",
            R"(\banswer[:=]\s*[a-d]\b)",
            R"(\b(question \d+)[:=])",
            R"(\bthe solution is\b)"
        };
        std::vector<std::regex> compiled;
        for (const char* src : sources) {
            compiled.emplace_back(src, std::regex::ECMAScript | std::regex::optimize);
        }
        return compiled;
    }();

    std::string lower = response_text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });

    for (const auto& pattern : leakage_patterns) {
        if (std::regex_search(lower, pattern)) {
            spdlog::warn("🛡️ Answer leakage detected in generated response; blocking it");
            return {false, kLeakageBlockResponse};
        }
    }
    return {true, response_text};
}

json build_generation_payload(const std::vector<PromptMessage>& messages,
                              const GenerationSettings& settings,
                              const std::string& system_instruction) {
    json contents = json::array();
    for (const auto& m : messages) {
        contents.push_back({
            {"role", to_string(m.role)},
            {"parts", {{{"text", m.content}}}}
        });
    }

    return {
        {"system_instruction", {{"parts", {{{"text", system_instruction}}}}}},
        {"contents", contents},
        {"generationConfig", {
            {"temperature", settings.temperature},
            {"topP", settings.top_p},
            {"topK", settings.top_k},
            {"maxOutputTokens", settings.max_output_tokens},
            {"candidateCount", settings.candidate_count},
            {"stopSequences", settings.stop_sequences}
        }}
    };
}

GeminiGenerator::GeminiGenerator(std::shared_ptr<KeyManager> key_manager,
                                 GenerationSettings settings,
                                 ServiceMetrics* metrics)
    : key_manager_(std::move(key_manager)), settings_(std::move(settings)), metrics_(metrics) {}

GenerationResult GeminiGenerator::generate(const std::vector<PromptMessage>& messages) {
    if (messages.empty()) {
        throw GenerationError("No messages to send");
    }
    if (!key_manager_->has_keys()) {
        throw GenerationError("GEMINI_API_KEY not configured (set it or provide keys.json)");
    }

    std::string payload = build_generation_payload(messages, settings_, kSystemPrompt)
                              .dump(-1, ' ', false, json::error_handler_t::replace);

    cpr::Response r;
    auto start = std::chrono::steady_clock::now();

    for (int attempt = 0; attempt <= settings_.max_retries; ++attempt) {
        // Re-read the key each attempt so a rotated key is used
        std::string url = base_url_ + settings_.model + ":generateContent?key=" + key_manager_->get_current_key();
        start = std::chrono::steady_clock::now();
        r = cpr::Post(cpr::Url{url},
                      cpr::Body{payload},
                      cpr::Header{{"Content-Type", "application/json"}});

        if (r.status_code == 200) break;

        if (r.status_code == 429 && attempt < settings_.max_retries) {
            spdlog::warn("⚠️ Gemini quota exceeded (429). Backing off {}s (attempt {}/{})",
                         1 << attempt, attempt + 1, settings_.max_retries + 1);
            key_manager_->report_rate_limit();
            std::this_thread::sleep_for(std::chrono::seconds(1 << attempt));
            continue;
        }

        spdlog::error("❌ Gemini API error [{}]: {}", r.status_code, r.text);
        throw GenerationError("Gemini API returned HTTP " + std::to_string(r.status_code));
    }

    if (r.status_code != 200) {
        throw GenerationError("Gemini API still rate limited after retries");
    }

    double latency = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (metrics_) metrics_->generation_latency_ms.store(latency * 1000.0);

    std::string raw_text;
    try {
        auto response_json = json::parse(r.text);
        const auto& parts = response_json.at("candidates").at(0).at("content").at("parts");
        for (const auto& part : parts) {
            raw_text += part.value("text", "");
        }
    } catch (const json::exception& e) {
        throw GenerationError(std::string("Malformed Gemini response: ") + e.what());
    }

    auto checked = validate_response(raw_text);
    return {checked.text, latency};
}

} // namespace edubot

#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "rag_types.hpp"
#include "KeyManager.hpp"
#include "ServiceMetrics.hpp"

namespace edubot {

class GenerationError : public std::runtime_error {
public:
    explicit GenerationError(const std::string& what) : std::runtime_error(what) {}
};

extern const char* const kLeakageBlockResponse;

struct GenerationResult {
    std::string text;
    double latency_s = 0.0;
};

struct GenerationSettings {
    std::string model = "gemini-2.5-flash-lite";
    double temperature = 0.3;  // low: consistent, factual
    double top_p = 0.85;
    int top_k = 40;
    int max_output_tokens = 600;
    int candidate_count = 1;
    std::vector<std::string> stop_sequences = {"User:", "Human:"};
    int max_retries = 2;       // on HTTP 429 only
};

struct ValidationResult {
    bool safe = true;
    std::string text;
};

// Post-generation answer-leakage check; a leak swaps in kLeakageBlockResponse.
ValidationResult validate_response(const std::string& response_text);

/**
 * @brief The external text generator: ordered messages in, text and latency out.
 */
class TextGenerator {
public:
    virtual ~TextGenerator() = default;

    /**
     * @throws GenerationError when no answer could be produced.
     */
    virtual GenerationResult generate(const std::vector<PromptMessage>& messages) = 0;
};

// Request body for generateContent: all messages become "contents", in order.
nlohmann::json build_generation_payload(const std::vector<PromptMessage>& messages,
                                        const GenerationSettings& settings,
                                        const std::string& system_instruction);

class GeminiGenerator : public TextGenerator {
public:
    GeminiGenerator(std::shared_ptr<KeyManager> key_manager,
                    GenerationSettings settings = {},
                    ServiceMetrics* metrics = nullptr);

    GenerationResult generate(const std::vector<PromptMessage>& messages) override;

private:
    std::shared_ptr<KeyManager> key_manager_;
    GenerationSettings settings_;
    ServiceMetrics* metrics_;
    const std::string base_url_ = "https://generativelanguage.googleapis.com/v1beta/models/";
};

} // namespace edubot

#include "context_assembler.hpp"
#include "conversation_window.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace edubot {

const char* const kSystemPrompt =
    "You are EduBot, a helpful AI assistant for an EdTech online learning platform.\n\n"
    "YOUR ROLE:\n"
    "- Explain how the platform works: course structure, navigation, enrollment, progress tracking, "
    "assessment formats, and certification workflows.\n"
    "- Help learners understand policies and procedures clearly and concisely.\n"
    "- Be friendly, structured, and easy to understand.\n\n"
    "STRICT RULES (ALWAYS FOLLOW):\n"
    "1. NEVER provide answers to quizzes, exams, assignments, or any assessment questions.\n"
    "2. NEVER solve, complete, or fill in any question, MCQ, blank, or problem.\n"
    "3. If a user asks you to answer a question or solve an exam problem, politely decline and redirect.\n"
    "4. Use ALL the CONTEXT chunks provided to construct a comprehensive answer.\n"
    "5. If multiple context chunks are relevant, synthesize information from ALL of them.\n"
    "6. If the context does not contain enough information, ask the user a clarifying question.\n"
    "7. Keep responses structured using bullet points or numbered steps when explaining workflows.\n"
    "8. Always be encouraging and supportive in tone.\n"
    "9. If unsure whether the user is asking about quizzes or final exams, ask for clarification.\n\n"
    "CONTEXT USAGE:\n"
    "- You are given multiple knowledge base chunks ranked by relevance.\n"
    "- If chunks cover different aspects of the topic, combine them into one coherent response.\n"
    "- Do NOT ignore lower-ranked chunks if they contain useful supplementary information.\n\n"
    "RESPONSE FORMAT:\n"
    "- Lead with a direct, clear answer.\n"
    "- Use bullet points or numbered steps for processes and workflows.\n"
    "- Reference specific platform features by name when mentioned in context.\n"
    "- End with a helpful follow-up offer.\n"
    "- Keep responses under 400 words unless a complex workflow needs more.\n\n"
    "Remember: you explain HOW the platform works; you do NOT solve academic content.\n";

namespace {

const std::string kRule(80, '=');

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

} // namespace

std::string render_augmented_message(const std::string& query,
                                     const std::vector<RetrievedChunk>& ranked_chunks,
                                     const std::string& category_hint,
                                     size_t k) {
    const size_t chunk_count = ranked_chunks.size();
    std::ostringstream msg;

    msg << "[RETRIEVAL chunks=" << chunk_count << " top_k=" << k
        << " category=" << (category_hint.empty() ? "none" : category_hint) << "]\n";
    msg << "KNOWLEDGE BASE CONTEXT (" << chunk_count << " chunks retrieved, ranked by relevance):\n";
    msg << kRule << "\n";

    if (ranked_chunks.empty()) {
        msg << "No specific context found in knowledge base.\n";
    } else {
        for (size_t i = 0; i < chunk_count; ++i) {
            const auto& chunk = ranked_chunks[i];
            if (i > 0) msg << "\n---\n\n";
            msg << "[CHUNK " << (i + 1)
                << " | Category: " << upper(to_string(chunk.category))
                << " | Title: " << chunk.title
                << " | Relevance: " << std::fixed << std::setprecision(3) << chunk.score << "]\n"
                << chunk.content << "\n";
        }
    }

    msg << kRule << "\n\n";
    msg << "USER QUESTION: " << query << "\n\n";

    if (ranked_chunks.empty()) {
        msg << "NOTE:\n"
            << "- No knowledge base content was found for this question.\n"
            << "- Do not invent platform details. Ask the user a clarifying question instead.";
    } else {
        msg << "INSTRUCTIONS:\n"
            << "- Synthesize information from ALL " << chunk_count << " chunks above to give a complete answer.\n"
            << "- If multiple chunks cover different aspects, combine them coherently.\n"
            << "- Be specific and reference actual platform features mentioned in the context.\n"
            << "- Never state facts that are not supported by the chunks above.\n"
            << "- Do NOT reveal assessment answers or solve exam questions under any circumstances.";
    }
    return msg.str();
}

std::vector<PromptMessage> assemble(const std::string& query,
                                    const std::vector<RetrievedChunk>& ranked_chunks,
                                    const std::vector<ConversationTurn>& window,
                                    const std::string& category_hint,
                                    size_t k) {
    std::vector<PromptMessage> messages;
    messages.reserve(window.size() + 1);

    for (const auto& turn : window) {
        PromptRole role = turn.role == Role::Assistant ? PromptRole::Model : PromptRole::User;
        messages.push_back({role, turn.content});
    }

    messages.push_back({PromptRole::User, render_augmented_message(query, ranked_chunks, category_hint, k)});
    return messages;
}

std::vector<PromptMessage> build_context(const std::string& query,
                                         const std::vector<RetrievedChunk>& ranked_chunks,
                                         const std::vector<ConversationTurn>& history,
                                         const std::string& category_hint,
                                         size_t k,
                                         size_t max_turns) {
    return assemble(query, ranked_chunks, prior_window(history, max_turns), category_hint, k);
}

} // namespace edubot

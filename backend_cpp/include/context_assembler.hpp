#pragma once
#include <string>
#include <vector>
#include "rag_types.hpp"

namespace edubot {

// System instruction sent alongside every assembled context.
extern const char* const kSystemPrompt;

/**
 * @brief Builds the exact message sequence handed to the generator.
 *
 * Window turns first (assistant turns become "model"), then a single user message with
 * the retrieval header, every chunk numbered from 1 in the given order, the literal
 * query and the instruction block. With no chunks the instruction block is replaced by a
 * no-content note.
 *
 * @param k The requested top_k, stated in the header next to the actual chunk count.
 */
std::vector<PromptMessage> assemble(const std::string& query,
                                    const std::vector<RetrievedChunk>& ranked_chunks,
                                    const std::vector<ConversationTurn>& window,
                                    const std::string& category_hint,
                                    size_t k);

// assemble() over prior_window(history, max_turns).
std::vector<PromptMessage> build_context(const std::string& query,
                                         const std::vector<RetrievedChunk>& ranked_chunks,
                                         const std::vector<ConversationTurn>& history,
                                         const std::string& category_hint,
                                         size_t k,
                                         size_t max_turns);

// The augmented user message alone.
std::string render_augmented_message(const std::string& query,
                                     const std::vector<RetrievedChunk>& ranked_chunks,
                                     const std::string& category_hint,
                                     size_t k);

} // namespace edubot

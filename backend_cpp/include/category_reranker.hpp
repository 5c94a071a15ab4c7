#pragma once
#include <optional>
#include <string>
#include <vector>
#include "rag_types.hpp"

namespace edubot {

struct RerankOptions {
    // When set, a same-category candidate scoring below the floor competes as "other".
    std::optional<float> preference_floor;
};

struct CategoryPartition {
    std::vector<RetrievedChunk> preferred;
    std::vector<RetrievedChunk> others;
};

/**
 * @brief Splits candidates by category; both halves come back score-descending
 *        (equal scores ordered by corpus row).
 */
CategoryPartition partition_by_category(const std::vector<RetrievedChunk>& candidates,
                                        Category category,
                                        std::optional<float> preference_floor = std::nullopt);

/**
 * @brief Quota merge of two score-sorted sequences.
 *
 * Takes min(k, |preferred|) from preferred and fills the remaining
 * k - taken slots from the head of others. The union is re-sorted by score,
 * so category decides membership, not order.
 */
std::vector<RetrievedChunk> merge_with_quota(const std::vector<RetrievedChunk>& preferred,
                                             const std::vector<RetrievedChunk>& others,
                                             size_t k);

/**
 * @brief Soft category preference over a candidate pool.
 *
 * Returns exactly min(k, candidates.size()) chunks sorted by score descending.
 * An empty or unknown hint means plain similarity order. Never throws.
 */
std::vector<RetrievedChunk> rank(const std::vector<RetrievedChunk>& candidates,
                                 const std::string& category_hint,
                                 size_t k,
                                 const RerankOptions& options = {});

// Score-descending sort, in place; equal scores go by corpus row, then candidate order.
void sort_by_score(std::vector<RetrievedChunk>& chunks);

} // namespace edubot

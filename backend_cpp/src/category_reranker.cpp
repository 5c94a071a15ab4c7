#include "category_reranker.hpp"
#include <algorithm>

namespace edubot {

void sort_by_score(std::vector<RetrievedChunk>& chunks) {
    std::stable_sort(chunks.begin(), chunks.end(), [](const RetrievedChunk& a, const RetrievedChunk& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.row < b.row;
    });
}

CategoryPartition partition_by_category(const std::vector<RetrievedChunk>& candidates,
                                        Category category,
                                        std::optional<float> preference_floor) {
    CategoryPartition partition;
    for (const auto& c : candidates) {
        bool same_category = c.category == category;
        bool above_floor = !preference_floor || c.score >= *preference_floor;
        if (same_category && above_floor) {
            partition.preferred.push_back(c);
        } else {
            partition.others.push_back(c);
        }
    }
    sort_by_score(partition.preferred);
    sort_by_score(partition.others);
    return partition;
}

std::vector<RetrievedChunk> merge_with_quota(const std::vector<RetrievedChunk>& preferred,
                                             const std::vector<RetrievedChunk>& others,
                                             size_t k) {
    size_t from_preferred = std::min(k, preferred.size());
    size_t from_others = std::min(k - from_preferred, others.size());

    std::vector<RetrievedChunk> result;
    result.reserve(from_preferred + from_others);
    result.insert(result.end(), preferred.begin(), preferred.begin() + from_preferred);
    result.insert(result.end(), others.begin(), others.begin() + from_others);

    sort_by_score(result);
    return result;
}

std::vector<RetrievedChunk> rank(const std::vector<RetrievedChunk>& candidates,
                                 const std::string& category_hint,
                                 size_t k,
                                 const RerankOptions& options) {
    if (candidates.empty() || k == 0) return {};

    auto category = category_from_string(category_hint);
    if (!category) {
        std::vector<RetrievedChunk> result = candidates;
        sort_by_score(result);
        if (result.size() > k) result.resize(k);
        return result;
    }

    auto partition = partition_by_category(candidates, *category, options.preference_floor);
    return merge_with_quota(partition.preferred, partition.others, k);
}

} // namespace edubot

#include <gtest/gtest.h>
#include <cmath>
#include <numeric>
#include "app_config.hpp"
#include "cache_manager.hpp"
#include "embedding_service.hpp"

using namespace edubot;

namespace {

float dot(const std::vector<float>& a, const std::vector<float>& b) {
    return std::inner_product(a.begin(), a.end(), b.begin(), 0.0f);
}

} // namespace

TEST(HashingEmbedderTest, OutputIsUnitLength) {
    HashingEmbedder embedder(64);
    auto v = embedder.embed("How do I download my certificate?");
    ASSERT_EQ(v.size(), 64u);
    EXPECT_NEAR(std::sqrt(dot(v, v)), 1.0f, 1e-5f);
}

TEST(HashingEmbedderTest, EmptyTextIsZeroVector) {
    HashingEmbedder embedder(32);
    auto v = embedder.embed("  ?! ");
    EXPECT_FLOAT_EQ(dot(v, v), 0.0f);
}

TEST(HashingEmbedderTest, DeterministicAndCaseInsensitive) {
    HashingEmbedder embedder;
    EXPECT_EQ(embedder.embed("Enroll in a Course"), embedder.embed("enroll in a course"));
}

TEST(HashingEmbedderTest, SharedWordsScoreHigher) {
    HashingEmbedder embedder;
    auto query = embedder.embed("exam retake attempts");
    auto related = embedder.embed("final exam retake policy and attempts");
    auto unrelated = embedder.embed("forum moderation guidelines");
    EXPECT_GT(dot(query, related), dot(query, unrelated));
}

TEST(HashingEmbedderTest, TokenizeSplitsOnNonAlnum) {
    auto tokens = HashingEmbedder::tokenize("Re-enroll, NOW: step2!");
    EXPECT_EQ(tokens, (std::vector<std::string>{"re", "enroll", "now", "step2"}));
}

TEST(HashingEmbedderTest, BatchMatchesSingle) {
    HashingEmbedder embedder(48);
    auto batch = embedder.embed_batch({"quiz", "progress dashboard"});
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[1], embedder.embed("progress dashboard"));
}

TEST(HashingEmbedderTest, ZeroDimensionRejected) {
    EXPECT_THROW(HashingEmbedder(0), std::invalid_argument);
}

TEST(EmbedderFactoryTest, SelectsBackendFromConfig) {
    AppConfig cfg;
    cfg.embedding_backend = "hashing";
    cfg.hashing_dimension = 96;
    auto embedder = create_embedder(cfg, nullptr, nullptr);
    EXPECT_EQ(embedder->name(), "hashing");
    EXPECT_EQ(embedder->dimension(), 96u);

    cfg.embedding_backend = "bert";
    EXPECT_THROW(create_embedder(cfg, nullptr, nullptr), std::invalid_argument);
}

TEST(Utf8Test, NeverSplitsMultibyteSequence) {
    std::string text = "caf\xC3\xA9!";   // "café!"
    EXPECT_EQ(utf8_safe_substr(text, 4), "caf");
    EXPECT_EQ(utf8_safe_substr(text, 5), "caf\xC3\xA9");
    EXPECT_EQ(utf8_safe_substr(text, 20), text);
}

TEST(LRUCacheTest, EvictsLeastRecentlyUsed) {
    LRUCache<std::string, int> cache(2);
    cache.put("a", 1);
    cache.put("b", 2);
    ASSERT_TRUE(cache.get("a").has_value());   // "b" is now the oldest
    cache.put("c", 3);

    EXPECT_FALSE(cache.get("b").has_value());
    EXPECT_EQ(cache.get("a").value(), 1);
    EXPECT_EQ(cache.get("c").value(), 3);
    EXPECT_EQ(cache.size(), 2u);
}

TEST(CacheManagerTest, CountsHitsAndMisses) {
    CacheManager cache(4);
    EXPECT_FALSE(cache.get_embedding("q").has_value());
    cache.set_embedding("q", {0.5f, 0.5f});
    EXPECT_EQ(cache.get_embedding("q").value(), (std::vector<float>{0.5f, 0.5f}));
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
}

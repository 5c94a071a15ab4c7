#include <gtest/gtest.h>
#include "faiss_vector_store.hpp"
#include "test_helpers.hpp"

using namespace edubot;
using edubot::test_support::make_entry;
using edubot::test_support::RuleEmbedder;

namespace {

// Vectors chosen so the query "q-x" ranks x1 > x2 == x3 > x4.
RuleEmbedder make_embedder() {
    return RuleEmbedder({
        {"body-x1", {1.0f, 0.0f, 0.0f}},
        {"body-x2", {0.6f, 0.8f, 0.0f}},
        {"body-x3", {0.6f, 0.0f, 0.8f}},
        {"body-x4", {0.0f, 1.0f, 0.0f}},
        {"q-x", {2.0f, 0.0f, 0.0f}}      // not unit length on purpose
    }, {0.0f, 0.0f, 1.0f});
}

std::vector<CorpusEntry> four_entries() {
    return {
        make_entry("x4", Category::Course, "Four", "body-x4"),
        make_entry("x2", Category::Course, "Two", "body-x2"),
        make_entry("x3", Category::Progress, "Three", "body-x3"),
        make_entry("x1", Category::Assessment, "One", "body-x1")
    };
}

} // namespace

TEST(FaissVectorStoreTest, BuildIndexesEveryEntry) {
    auto embedder = make_embedder();
    FaissVectorStore store;
    store.build(four_entries(), embedder);

    EXPECT_EQ(store.size(), 4u);
    EXPECT_EQ(store.dimension(), 3u);
    EXPECT_EQ(store.entries()[0].id, "x4");
    EXPECT_EQ(store.stats().by_category.at("course"), 2u);
}

TEST(FaissVectorStoreTest, SearchOrdersByCosineThenInsertionRow) {
    auto embedder = make_embedder();
    FaissVectorStore store;
    store.build(four_entries(), embedder);

    auto hits = store.search(embedder.embed("q-x"), 4);
    ASSERT_EQ(hits.size(), 4u);
    EXPECT_EQ(hits[0].entry->id, "x1");
    EXPECT_NEAR(hits[0].score, 1.0f, 1e-5f);
    // x2 (row 1) and x3 (row 2) tie at 0.6
    EXPECT_EQ(hits[1].entry->id, "x2");
    EXPECT_EQ(hits[2].entry->id, "x3");
    EXPECT_NEAR(hits[1].score, 0.6f, 1e-5f);
    EXPECT_EQ(hits[3].entry->id, "x4");
    EXPECT_LT(hits[1].row, hits[2].row);
}

TEST(FaissVectorStoreTest, SearchIsCappedByCorpusSize) {
    auto embedder = make_embedder();
    FaissVectorStore store;
    store.build(four_entries(), embedder);

    EXPECT_EQ(store.search(embedder.embed("q-x"), 100).size(), 4u);
    EXPECT_EQ(store.search(embedder.embed("q-x"), 2).size(), 2u);
    EXPECT_TRUE(store.search(embedder.embed("q-x"), 0).empty());
}

TEST(FaissVectorStoreTest, EmptyStoreSearchReturnsNothing) {
    FaissVectorStore store;
    EXPECT_TRUE(store.empty());
    EXPECT_TRUE(store.search({1.0f, 0.0f, 0.0f}, 3).empty());
}

TEST(FaissVectorStoreTest, EmptyCorpusIsRejected) {
    auto embedder = make_embedder();
    FaissVectorStore store;
    EXPECT_THROW(store.build({}, embedder), KnowledgeBaseError);
    EXPECT_TRUE(store.empty());
}

TEST(FaissVectorStoreTest, WrongQueryDimensionThrows) {
    auto embedder = make_embedder();
    FaissVectorStore store;
    store.build(four_entries(), embedder);
    EXPECT_THROW(store.search({1.0f, 0.0f}, 2), std::invalid_argument);
}

TEST(FaissVectorStoreTest, InconsistentEmbeddingsLeaveStoreUntouched) {
    // The rule for "body-bad" yields a 2-d vector while the embedder reports 3 dimensions
    RuleEmbedder embedder({{"body-bad", {1.0f, 0.0f}}}, {0.0f, 0.0f, 1.0f});
    FaissVectorStore store;
    std::vector<CorpusEntry> corpus = {
        make_entry("ok", Category::Course, "Fine", "body-ok"),
        make_entry("bad", Category::Course, "Broken", "body-bad")
    };
    EXPECT_THROW(store.build(corpus, embedder), KnowledgeBaseError);
    EXPECT_TRUE(store.empty());
    EXPECT_EQ(store.dimension(), 0u);
}

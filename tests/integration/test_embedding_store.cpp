/**
 * @file test_embedding_store.cpp
 * @brief Integration tests for the vector section and similarity search
 */

#include "../common/db_fixture.hpp"
#include <vector/embedding_store.hpp>
#include <vector/semantic_index.hpp>
#include <set>
#include <stdexcept>
#include <vector>

using namespace WikiCorpus;
using namespace WikiCorpus::test_support;

class EmbeddingStoreTest : public DatabaseTest {};

TEST_F(EmbeddingStoreTest, PutGetRoundTrip) {
    EmbeddingStore store(*db_, schema_name_, "vectors", 3);
    store.put("Paris", {0.25f, -1.5f, 3.0f});

    auto v = store.get("Paris");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, (std::vector<float>{0.25f, -1.5f, 3.0f}));
    EXPECT_FALSE(store.get("Berlin").has_value());
}

TEST_F(EmbeddingStoreTest, PutIsUpsert) {
    EmbeddingStore store(*db_, schema_name_, "vectors", 2);
    store.put("k", {1.0f, 0.0f});
    store.put("k", {0.0f, 1.0f});

    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(*store.get("k"), (std::vector<float>{0.0f, 1.0f}));
}

TEST_F(EmbeddingStoreTest, RemoveAndSize) {
    EmbeddingStore store(*db_, schema_name_, "vectors", 2);
    store.put("a", {1.0f, 0.0f});
    store.put("b", {0.0f, 1.0f});
    EXPECT_EQ(store.size(), 2u);

    EXPECT_TRUE(store.remove("a"));
    EXPECT_FALSE(store.remove("a"));
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(EmbeddingStoreTest, FindSimilarWithTies) {
    EmbeddingStore store(*db_, schema_name_, "vectors", 2);
    store.put("a", {1.0f, 0.0f});
    store.put("b", {0.0f, 1.0f});
    store.put("c", {1.0f, 0.0f});

    auto top = store.find_similar({1.0f, 0.0f}, 2);
    ASSERT_EQ(top.size(), 2u);
    std::set<std::string> keys = {top[0].key, top[1].key};
    EXPECT_EQ(keys, (std::set<std::string>{"a", "c"}));
    EXPECT_NEAR(top[0].score, 1.0f, 1e-6f);
    EXPECT_NEAR(top[1].score, 1.0f, 1e-6f);

    auto all = store.find_similar({1.0f, 0.0f}, 10);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[2].key, "b");
    EXPECT_NEAR(all[2].score, 0.0f, 1e-6f);
}

TEST_F(EmbeddingStoreTest, ResultsSortedAndBounded) {
    EmbeddingStore store(*db_, schema_name_, "vectors", 3);
    for (int i = 0; i < 20; ++i) {
        store.put("k" + std::to_string(i), {static_cast<float>(i), 1.0f, static_cast<float>(20 - i)});
    }

    auto top = store.find_similar({1.0f, 0.0f, 0.0f}, 5);
    ASSERT_EQ(top.size(), 5u);
    for (size_t i = 1; i < top.size(); ++i) {
        EXPECT_GE(top[i - 1].score, top[i].score);
    }
    EXPECT_EQ(top[0].key, "k19");
    EXPECT_TRUE(store.find_similar({1.0f, 0.0f, 0.0f}, 0).empty());
}

TEST_F(EmbeddingStoreTest, ZeroQueryScoresZero) {
    EmbeddingStore store(*db_, schema_name_, "vectors", 2);
    store.put("a", {1.0f, 0.0f});

    auto top = store.find_similar({0.0f, 0.0f}, 1);
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].score, 0.0f);
}

TEST_F(EmbeddingStoreTest, DimensionMismatchIsFatal) {
    EmbeddingStore store(*db_, schema_name_, "vectors", 2);
    store.put("a", {1.0f, 0.0f});

    EXPECT_THROW(store.put("b", {1.0f, 0.0f, 0.0f}), DimensionMismatchError);
    EXPECT_THROW(store.find_similar({1.0f, 0.0f, 0.0f}, 1), DimensionMismatchError);
    EXPECT_THROW(static_cast<void>(EmbeddingStore(*db_, schema_name_, "vectors", 3)), DimensionMismatchError);
}

TEST_F(EmbeddingStoreTest, CorruptStoredVectorFailsWholeQuery) {
    EmbeddingStore store(*db_, schema_name_, "vectors", 2);
    store.put("good", {1.0f, 0.0f});
    // A row written behind the store's back with three floats
    db_->execute("INSERT INTO " + schema_name_ + ".embeddings (section, key, vector) "
                 "VALUES ('vectors', 'bad', '\\x0000803f0000803f0000803f'::bytea)");

    EXPECT_THROW(store.find_similar({1.0f, 0.0f}, 5), DimensionMismatchError);
    // The connection is usable again after the failed read transaction
    EXPECT_EQ(store.size(), 2u);
}

TEST_F(EmbeddingStoreTest, SectionsAreIndependent) {
    EmbeddingStore small(*db_, schema_name_, "small", 2);
    EmbeddingStore large(*db_, schema_name_, "large", 4);
    small.put("x", {1.0f, 0.0f});
    large.put("x", {0.0f, 0.0f, 0.0f, 1.0f});

    EXPECT_EQ(small.size(), 1u);
    EXPECT_EQ(large.size(), 1u);
    EXPECT_EQ(large.get("x")->size(), 4u);
}

TEST_F(EmbeddingStoreTest, SemanticIndexUsesEmbedder) {
    EmbeddingStore store(*db_, schema_name_, "vectors", 2);
    // Toy embedder: [count of 'a', count of 'b']
    SemanticIndex index(store, [](const std::string& text) {
        std::vector<float> v(2, 0.0f);
        for (char c : text) {
            if (c == 'a') v[0] += 1.0f;
            if (c == 'b') v[1] += 1.0f;
        }
        return v;
    });

    std::vector<Article> articles = {
        make_article("Alpha", "aaaa"),
        make_article("Beta", "bbbb"),
        make_redirect("Alias", "Alpha"),
    };
    EXPECT_EQ(index.index_articles(articles), 2u);
    EXPECT_EQ(store.size(), 2u);

    auto top = index.search("aaa", 1);
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].key, "Alpha");
}

TEST_F(EmbeddingStoreTest, EmbedderErrorsPropagateUnchanged) {
    EmbeddingStore store(*db_, schema_name_, "vectors", 2);
    SemanticIndex index(store, [](const std::string&) -> std::vector<float> {
        throw std::runtime_error("model offline");
    });

    try {
        index.index("k", "text");
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "model offline");
    }
    EXPECT_EQ(store.size(), 0u);
}

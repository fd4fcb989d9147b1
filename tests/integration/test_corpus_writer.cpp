/**
 * @file test_corpus_writer.cpp
 * @brief Integration tests for transactional writes and get-or-create dedup
 */

#include "../common/db_fixture.hpp"
#include <storage/corpus_reader.hpp>
#include <storage/corpus_writer.hpp>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

using namespace WikiCorpus;
using namespace WikiCorpus::test_support;

class CorpusWriterTest : public DatabaseTest {
protected:
    size_t count(const std::string& table) {
        auto n = db_->query_single("SELECT count(*) FROM " + schema_name_ + "." + table);
        return n ? std::stoull(*n) : 0;
    }

    // Polls pg_stat_activity until the backend is waiting on a row lock
    bool wait_until_blocked(const std::string& backend_pid) {
        auto monitor = connect();
        for (int i = 0; i < 200; ++i) {
            auto wait = monitor->query_single(
                "SELECT wait_event_type FROM pg_stat_activity WHERE pid = $1::int", {backend_pid});
            if (wait && *wait == "Lock") return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        return false;
    }

    // Writes `article` on a second connection while db_ holds an uncommitted
    // row with the same natural key, committing only once the writer blocks.
    // Returns the id the writer resolved for that key.
    std::optional<CorpusWriter::Id> write_against_pending_insert(
        const std::string& insert_sql, const std::vector<std::string>& params,
        const Article& article, bool by_image, const std::string& key, CorpusWriter::Id& winner) {
        auto conn = connect();
        auto pid = conn->query_single("SELECT pg_backend_pid()");
        EXPECT_TRUE(pid.has_value());
        if (!pid) return std::nullopt;
        CorpusWriter writer(*conn, schema_name_);

        PostgresConnection::Transaction txn(*db_);
        auto inserted = db_->query_single(insert_sql, params);
        EXPECT_TRUE(inserted.has_value());
        if (!inserted) return std::nullopt;
        winner = std::stoll(*inserted);

        std::string error;
        std::thread racer([&] {
            try {
                writer.write(article);
            } catch (const std::exception& e) {
                error = e.what();
            }
        });

        bool blocked = wait_until_blocked(*pid);
        txn.commit();
        racer.join();

        EXPECT_TRUE(blocked) << "writer never waited on the pending insert";
        EXPECT_EQ(error, "");
        return by_image ? writer.cache().find_image(key) : writer.cache().find_category(key);
    }
};

TEST_F(CorpusWriterTest, WritesHeaderAndRelations) {
    CorpusWriter writer(*db_, schema_name_);
    auto img = ImageRef::from_markup("Eiffel.jpg", std::string("The tower"));
    auto id = writer.write(make_article("Paris", "Paris is the capital.", {"Capitals", "Cities"}, {img}));

    EXPECT_GT(id, 0);
    EXPECT_EQ(count("articles"), 1u);
    EXPECT_EQ(count("article_search"), 1u);
    EXPECT_EQ(count("categories"), 2u);
    EXPECT_EQ(count("article_categories"), 2u);
    EXPECT_EQ(count("images"), 1u);
    EXPECT_EQ(count("article_images"), 1u);
    EXPECT_EQ(writer.cache().category_count(), 2u);
    EXPECT_EQ(writer.cache().image_count(), 1u);
}

TEST_F(CorpusWriterTest, RedirectWritesNoRelations) {
    CorpusWriter writer(*db_, schema_name_);
    writer.write(make_redirect("UK", "United Kingdom"));

    EXPECT_EQ(count("articles"), 1u);
    EXPECT_EQ(count("redirects"), 1u);
    EXPECT_EQ(count("article_categories"), 0u);
    EXPECT_EQ(count("article_images"), 0u);
}

TEST_F(CorpusWriterTest, CategoryCreatedOnceAcrossArticles) {
    CorpusWriter writer(*db_, schema_name_);
    for (int i = 0; i < 5; ++i) {
        writer.write(make_article("City " + std::to_string(i), "text", {"Cities"}));
    }

    EXPECT_EQ(count("categories"), 1u);
    EXPECT_EQ(count("article_categories"), 5u);
}

TEST_F(CorpusWriterTest, SameImageHashCollapses) {
    CorpusWriter writer(*db_, schema_name_);
    auto a = ImageRef::from_markup("eiffel tower.jpg", std::string("first caption"));
    auto b = ImageRef::from_markup("Eiffel_tower.jpg", std::string("second caption"));
    ASSERT_EQ(a.hash, b.hash);

    writer.write(make_article("One", "x", {}, {a}));
    writer.write(make_article("Two", "y", {}, {b}));

    EXPECT_EQ(count("images"), 1u);
    EXPECT_EQ(count("article_images"), 2u);
}

TEST_F(CorpusWriterTest, IdenticalBytesCollapseRegardlessOfNameAndCaption) {
    CorpusWriter writer(*db_, schema_name_);
    const std::string bytes = "\x89PNG\r\n\x1a\nsame pixels";
    auto a = ImageRef::from_bytes("Sunset over Lisbon.png", bytes, std::string("Evening"));
    auto b = ImageRef::from_bytes("IMG_0042.png", bytes, std::string("Unrelated caption"));
    auto c = ImageRef::from_bytes("IMG_0042.png", bytes + "!", std::string("Unrelated caption"));
    ASSERT_EQ(a.hash, b.hash);
    ASSERT_NE(b.hash, c.hash);

    writer.write(make_article("One", "x", {}, {a}));
    writer.write(make_article("Two", "y", {}, {b}));
    writer.write(make_article("Three", "z", {}, {c}));

    EXPECT_EQ(count("images"), 2u);
    EXPECT_EQ(count("article_images"), 3u);
    EXPECT_EQ(db_->query_single("SELECT filename FROM " + schema_name_ + ".images WHERE hash = $1", {a.hash}).value_or(""),
              "Sunset over Lisbon.png");
}

TEST_F(CorpusWriterTest, LosingCategoryInsertRereadsWinningRow) {
    CorpusWriter::Id winner = 0;
    auto resolved = write_against_pending_insert(
        "INSERT INTO " + schema_name_ + ".categories (name) VALUES ($1) RETURNING id", {"Race"},
        make_article("Racer", "t", {"Race"}), false, "Race", winner);

    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, winner);
    EXPECT_EQ(count("categories"), 1u);
    EXPECT_EQ(db_->query_single("SELECT category_id FROM " + schema_name_ + ".article_categories").value_or(""),
              std::to_string(winner));
}

TEST_F(CorpusWriterTest, LosingImageInsertRereadsWinningRow) {
    auto img = ImageRef::from_bytes("Race.png", "race pixels", std::string("Finish line"));
    CorpusWriter::Id winner = 0;
    auto resolved = write_against_pending_insert(
        "INSERT INTO " + schema_name_ + ".images (filename, path, size, mime_type, hash) "
        "VALUES ($1, $2, $3, $4, $5) RETURNING id",
        {"Other.png", "/images/Other.png", "11", "image/png", img.hash},
        make_article("Racer", "t", {}, {img}), true, img.hash, winner);

    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, winner);
    EXPECT_EQ(count("images"), 1u);
    EXPECT_EQ(db_->query_single("SELECT image_id FROM " + schema_name_ + ".article_images").value_or(""),
              std::to_string(winner));
}

TEST_F(CorpusWriterTest, FailedBatchLeavesNothingBehind) {
    CorpusWriter writer(*db_, schema_name_);
    writer.write(make_article("Existing", "x"));

    std::vector<Article> batch = {
        make_article("New One", "a", {"Fresh"}),
        make_article("Existing", "duplicate title")
    };

    try {
        writer.write_batch(batch);
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_TRUE(e.is_unique_violation());
        EXPECT_NE(std::string(e.what()).find("Existing"), std::string::npos);
    }

    EXPECT_EQ(count("articles"), 1u);
    EXPECT_EQ(count("categories"), 0u);
    // The rolled-back category id must not be reused from the cache
    EXPECT_FALSE(writer.cache().find_category("Fresh").has_value());

    writer.write(make_article("Later", "z", {"Fresh"}));
    EXPECT_EQ(count("categories"), 1u);
}

TEST_F(CorpusWriterTest, InvalidArticleRejectedBeforeWriting) {
    CorpusWriter writer(*db_, schema_name_);
    EXPECT_THROW(writer.write(make_article("", "no title")), ValidationError);
    EXPECT_EQ(count("articles"), 0u);
}

TEST_F(CorpusWriterTest, ConcurrentWritersShareCategoryRow) {
    constexpr int kWriters = 4;
    std::vector<std::thread> threads;
    std::vector<std::string> errors(kWriters);

    for (int w = 0; w < kWriters; ++w) {
        threads.emplace_back([&, w] {
            try {
                auto conn = connect();
                CorpusWriter writer(*conn, schema_name_);
                for (int i = 0; i < 10; ++i) {
                    writer.write(make_article("W" + std::to_string(w) + "-" + std::to_string(i), "t",
                                              {"Shared", "Only " + std::to_string(w)}));
                }
            } catch (const std::exception& e) {
                errors[w] = e.what();
            }
        });
    }
    for (auto& t : threads) t.join();

    for (const auto& e : errors) EXPECT_EQ(e, "");
    EXPECT_EQ(count("articles"), 40u);
    EXPECT_EQ(count("categories"), 1u + kWriters);

    CorpusReader reader(*db_, schema_name_);
    EXPECT_EQ(reader.articles_in_category("Shared").size(), 40u);
}

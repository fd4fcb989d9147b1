/**
 * @file test_corpus_reader.cpp
 * @brief Integration tests for lookups, redirects and full-text search
 */

#include "../common/db_fixture.hpp"
#include <storage/corpus_reader.hpp>
#include <storage/corpus_writer.hpp>
#include <vector>

using namespace WikiCorpus;
using namespace WikiCorpus::test_support;

class CorpusReaderTest : public DatabaseTest {
protected:
    void SetUp() override {
        DatabaseTest::SetUp();
        if (IsSkipped()) return;

        auto img1 = ImageRef::from_markup("Eiffel.jpg", std::string("The tower"));
        auto img2 = ImageRef::from_markup("Louvre.png", std::nullopt);

        std::vector<Article> articles = {
            make_article("Paris", "Paris is the capital and largest city of France.",
                         {"Capitals", "Cities in France"}, {img1, img2}),
            make_article("Lyon", "Lyon is a city in France known for its cuisine.", {"Cities in France"}),
            make_article("Berlin", "Berlin is the capital of Germany.", {"Capitals"}),
            make_redirect("Paname", "Paris"),
            make_redirect("City of Light", "Paname"),
            make_redirect("Loop A", "Loop B"),
            make_redirect("Loop B", "Loop A"),
            make_redirect("Nowhere", "Missing Article"),
        };
        CorpusWriter writer(*db_, schema_name_);
        writer.write_batch(articles);
        reader_ = std::make_unique<CorpusReader>(*db_, schema_name_);
    }

    std::unique_ptr<CorpusReader> reader_;
};

TEST_F(CorpusReaderTest, ReadsArticleWithRelations) {
    auto a = reader_->get_article("Paris");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->title, "Paris");
    EXPECT_EQ(a->content, "Paris is the capital and largest city of France.");
    EXPECT_EQ(a->size, a->content.size());
    EXPECT_EQ(format_iso8601(a->last_modified), "2024-01-15T10:30:00Z");
    EXPECT_FALSE(a->is_redirect);
    EXPECT_EQ(a->categories, (std::set<std::string>{"Capitals", "Cities in France"}));
    ASSERT_EQ(a->images.size(), 2u);
    EXPECT_EQ(a->images[0].filename, "Eiffel.jpg");
    EXPECT_EQ(a->images[0].caption, "The tower");
    EXPECT_EQ(a->images[1].filename, "Louvre.png");
    EXPECT_FALSE(a->images[1].caption.has_value());
}

TEST_F(CorpusReaderTest, FollowsRedirectChain) {
    auto a = reader_->get_article("City of Light");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->title, "Paris");
    EXPECT_EQ(a->content, "Paris is the capital and largest city of France.");
}

TEST_F(CorpusReaderTest, RawRedirectCarriesNoRelations) {
    auto a = reader_->get_article_raw("Paname");
    ASSERT_TRUE(a.has_value());
    EXPECT_TRUE(a->is_redirect);
    EXPECT_EQ(a->redirect_target, "Paris");
    EXPECT_TRUE(a->categories.empty());
    EXPECT_TRUE(a->images.empty());
    EXPECT_EQ(reader_->get_redirect("Paname"), "Paris");
    EXPECT_FALSE(reader_->get_redirect("Paris").has_value());
}

TEST_F(CorpusReaderTest, CycleAndDanglingRedirectsYieldNothing) {
    EXPECT_FALSE(reader_->get_article("Loop A").has_value());
    EXPECT_FALSE(reader_->get_article("Nowhere").has_value());
    EXPECT_FALSE(reader_->get_article("Never Written").has_value());
}

TEST_F(CorpusReaderTest, FullTextSearchRanksMatches) {
    auto hits = reader_->search_articles("capital", 10);
    ASSERT_EQ(hits.size(), 2u);
    std::set<std::string> titles = {hits[0].title, hits[1].title};
    EXPECT_EQ(titles, (std::set<std::string>{"Paris", "Berlin"}));
    EXPECT_GE(hits[0].rank, hits[1].rank);

    EXPECT_EQ(reader_->search_articles("cuisine", 10).size(), 1u);
    EXPECT_TRUE(reader_->search_articles("zeppelin", 10).empty());
    EXPECT_EQ(reader_->search_articles("france", 1).size(), 1u);
}

TEST_F(CorpusReaderTest, TitleMatchesAreSearchable) {
    auto hits = reader_->search_articles("Lyon", 5);
    ASSERT_FALSE(hits.empty());
    EXPECT_EQ(hits[0].title, "Lyon");
}

TEST_F(CorpusReaderTest, CategoryListings) {
    EXPECT_EQ(reader_->list_categories(), (std::vector<std::string>{"Capitals", "Cities in France"}));
    EXPECT_EQ(reader_->articles_in_category("Capitals"), (std::vector<std::string>{"Berlin", "Paris"}));
    EXPECT_TRUE(reader_->articles_in_category("Unknown").empty());
}

TEST_F(CorpusReaderTest, CountsEveryRow) {
    EXPECT_EQ(reader_->count_articles(), 8u);
}

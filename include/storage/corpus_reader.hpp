/**
 * @file corpus_reader.hpp
 * @brief Read side of the corpus store
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <parser/article.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace WikiCorpus {

struct SearchHit {
    std::string title;
    size_t size = 0;
    double rank = 0.0;
};

class CorpusReader {
public:
    static constexpr int MAX_REDIRECT_HOPS = 16;

    CorpusReader(PostgresConnection& db, std::string schema, std::string ts_config = "english");

    /**
     * @brief Load an article by title, following redirects.
     *
     * The returned article is the redirect target with its categories and
     * images (in stored order). A redirect chain that loops, exceeds
     * MAX_REDIRECT_HOPS or ends at a missing title yields nullopt.
     */
    std::optional<Article> get_article(const std::string& title);

    /**
     * @brief Load exactly the row stored under title, without following redirects.
     */
    std::optional<Article> get_article_raw(const std::string& title);

    std::optional<std::string> get_redirect(const std::string& title);

    /**
     * @brief Full-text search over title and content, best match first.
     */
    std::vector<SearchHit> search_articles(const std::string& query, size_t limit = 10);

    std::vector<std::string> list_categories();

    std::vector<std::string> articles_in_category(const std::string& name);

    size_t count_articles();

private:
    void load_relations(int64_t article_id, Article& article);

    PostgresConnection& db_;
    std::string schema_;
    std::string ts_config_;
};

} // namespace WikiCorpus

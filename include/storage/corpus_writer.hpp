/**
 * @file corpus_writer.hpp
 * @brief Transactional article writer with category/image deduplication
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <parser/article.hpp>
#include <storage/dedup_cache.hpp>
#include <cstdint>
#include <span>
#include <string>

namespace WikiCorpus {

/**
 * @brief Persists articles and their relations.
 *
 * Every article is written as: header row, search document, then either the
 * redirect row or the category and image links. write() and write_batch()
 * wrap that in one transaction; nothing from a failed call persists.
 *
 * Categories and images of a whole call are resolved first, in key order,
 * so concurrent writers always lock shared rows in the same order.
 *
 * The DedupCache is owned by the writer. Use one writer per connection and
 * per thread.
 */
class CorpusWriter {
public:
    using Id = DedupCache::Id;

    CorpusWriter(PostgresConnection& db, std::string schema,
                 DedupCache cache = DedupCache(), std::string ts_config = "english");

    CorpusWriter(const CorpusWriter&) = delete;
    CorpusWriter& operator=(const CorpusWriter&) = delete;

    /**
     * @brief Write one article in its own transaction.
     * @return Row id of the article
     * @throws ValidationError if the article breaks a field invariant
     * @throws StoreError on database failure, annotated with the title
     */
    Id write(const Article& article);

    /**
     * @brief Write a group of articles in a single transaction.
     * @return Number of articles written (always articles.size() on success)
     */
    size_t write_batch(std::span<const Article> articles);

    const DedupCache& cache() const { return cache_; }

private:
    void resolve_relations(std::span<const Article> articles);
    Id insert_article(const Article& article);
    Id get_or_create_category(const std::string& name);
    Id get_or_create_image(const ImageRef& image);

    PostgresConnection& db_;
    std::string schema_;
    std::string ts_config_;
    DedupCache cache_;

    std::string sql_insert_article_;
    std::string sql_insert_search_;
    std::string sql_insert_redirect_;
    std::string sql_select_category_;
    std::string sql_insert_category_;
    std::string sql_link_category_;
    std::string sql_select_image_;
    std::string sql_insert_image_;
    std::string sql_link_image_;
};

} // namespace WikiCorpus

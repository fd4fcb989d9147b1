/**
 * @file corpus_schema.hpp
 * @brief DDL for the corpus tables inside one PostgreSQL schema
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <string>

namespace WikiCorpus {

/**
 * @brief Creates, checks and drops the corpus schema.
 *
 * Tables: schema_version, articles, article_search, categories,
 * article_categories, images, article_images, redirects,
 * embedding_sections, embeddings.
 */
class CorpusSchema {
public:
    static constexpr int VERSION = 1;

    /**
     * @throws std::invalid_argument if schema is not a simple identifier
     */
    CorpusSchema(PostgresConnection& db, std::string schema);

    /**
     * @brief Create every table and index if missing and record VERSION.
     *
     * Safe to call repeatedly and from concurrent processes.
     */
    void initialize();

    bool exists();
    bool is_current();

    /**
     * @brief DROP SCHEMA ... CASCADE
     */
    void drop();

    const std::string& name() const { return schema_; }

private:
    PostgresConnection& db_;
    std::string schema_;
};

} // namespace WikiCorpus

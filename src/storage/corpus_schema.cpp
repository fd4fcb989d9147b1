/**
 * @file corpus_schema.cpp
 * @brief Corpus DDL
 */

#include <storage/corpus_schema.hpp>
#include <config/config.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <stdexcept>

namespace WikiCorpus {

CorpusSchema::CorpusSchema(PostgresConnection& db, std::string schema)
    : db_(db), schema_(std::move(schema)) {
    if (!is_simple_identifier(schema_)) {
        throw std::invalid_argument("Invalid schema name: '" + schema_ + "'");
    }
}

void CorpusSchema::initialize() {
    const std::string s = schema_ + ".";

    PostgresConnection::Transaction txn(db_);

    // Serialise concurrent initialisers; CREATE ... IF NOT EXISTS alone races on catalog rows
    db_.execute("SELECT pg_advisory_xact_lock(hashtext($1))", {"wikicorpus_schema:" + schema_});

    db_.execute("CREATE SCHEMA IF NOT EXISTS " + schema_);

    db_.execute(
        "CREATE TABLE IF NOT EXISTS " + s + "schema_version ("
        "  version INTEGER PRIMARY KEY,"
        "  applied_at TIMESTAMPTZ NOT NULL DEFAULT now())");

    db_.execute(
        "CREATE TABLE IF NOT EXISTS " + s + "articles ("
        "  id BIGSERIAL PRIMARY KEY,"
        "  title TEXT NOT NULL UNIQUE CHECK (octet_length(title) BETWEEN 1 AND 255),"
        "  content TEXT NOT NULL,"
        "  size BIGINT NOT NULL,"
        "  last_modified TIMESTAMPTZ NOT NULL,"
        "  is_redirect BOOLEAN NOT NULL DEFAULT FALSE)");

    db_.execute(
        "CREATE TABLE IF NOT EXISTS " + s + "article_search ("
        "  article_id BIGINT PRIMARY KEY REFERENCES " + s + "articles(id) ON DELETE CASCADE,"
        "  document TSVECTOR NOT NULL)");
    db_.execute(
        "CREATE INDEX IF NOT EXISTS article_search_document_idx ON " + s +
        "article_search USING GIN (document)");

    db_.execute(
        "CREATE TABLE IF NOT EXISTS " + s + "categories ("
        "  id BIGSERIAL PRIMARY KEY,"
        "  name TEXT NOT NULL UNIQUE)");

    db_.execute(
        "CREATE TABLE IF NOT EXISTS " + s + "article_categories ("
        "  article_id BIGINT NOT NULL REFERENCES " + s + "articles(id) ON DELETE CASCADE,"
        "  category_id BIGINT NOT NULL REFERENCES " + s + "categories(id),"
        "  PRIMARY KEY (article_id, category_id))");
    db_.execute(
        "CREATE INDEX IF NOT EXISTS article_categories_category_idx ON " + s +
        "article_categories (category_id)");

    db_.execute(
        "CREATE TABLE IF NOT EXISTS " + s + "images ("
        "  id BIGSERIAL PRIMARY KEY,"
        "  filename TEXT NOT NULL,"
        "  path TEXT NOT NULL,"
        "  size BIGINT NOT NULL,"
        "  mime_type TEXT NOT NULL,"
        "  hash TEXT NOT NULL UNIQUE,"
        "  caption TEXT)");

    db_.execute(
        "CREATE TABLE IF NOT EXISTS " + s + "article_images ("
        "  article_id BIGINT NOT NULL REFERENCES " + s + "articles(id) ON DELETE CASCADE,"
        "  position INTEGER NOT NULL,"
        "  image_id BIGINT NOT NULL REFERENCES " + s + "images(id),"
        "  PRIMARY KEY (article_id, position))");

    db_.execute(
        "CREATE TABLE IF NOT EXISTS " + s + "redirects ("
        "  from_title TEXT PRIMARY KEY REFERENCES " + s + "articles(title) ON DELETE CASCADE,"
        "  to_title TEXT NOT NULL)");

    db_.execute(
        "CREATE TABLE IF NOT EXISTS " + s + "embedding_sections ("
        "  section TEXT PRIMARY KEY,"
        "  dimension INTEGER NOT NULL CHECK (dimension > 0))");

    db_.execute(
        "CREATE TABLE IF NOT EXISTS " + s + "embeddings ("
        "  section TEXT NOT NULL REFERENCES " + s + "embedding_sections(section) ON DELETE CASCADE,"
        "  key TEXT NOT NULL,"
        "  vector BYTEA NOT NULL,"
        "  PRIMARY KEY (section, key))");

    db_.execute(
        "INSERT INTO " + s + "schema_version (version) VALUES ($1) ON CONFLICT DO NOTHING",
        {std::to_string(VERSION)});

    txn.commit();
    Logger::debug("Schema " + schema_ + " initialized (version " + std::to_string(VERSION) + ")");
}

bool CorpusSchema::exists() {
    auto found = db_.query_single(
        "SELECT 1 FROM information_schema.tables WHERE table_schema = $1 AND table_name = 'schema_version'",
        {schema_});
    return found.has_value();
}

bool CorpusSchema::is_current() {
    if (!exists()) return false;
    auto version = db_.query_single("SELECT max(version) FROM " + schema_ + ".schema_version");
    return version && std::stoi(*version) == VERSION;
}

void CorpusSchema::drop() {
    db_.execute("DROP SCHEMA IF EXISTS " + schema_ + " CASCADE");
    Logger::debug("Schema " + schema_ + " dropped");
}

} // namespace WikiCorpus

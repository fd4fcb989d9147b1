/**
 * @file embedding_store.cpp
 * @brief EmbeddingStore implementation
 */

#include <vector/embedding_store.hpp>
#include <storage/format_utils.hpp>
#include <config/config.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <stdexcept>

namespace WikiCorpus {

EmbeddingStore::EmbeddingStore(PostgresConnection& db, std::string schema, std::string section, size_t dimension)
    : db_(db), section_(std::move(section)), dimension_(dimension) {
    if (!is_simple_identifier(schema)) {
        throw std::invalid_argument("Invalid schema name: '" + schema + "'");
    }
    if (section_.empty()) {
        throw std::invalid_argument("Embedding section name must not be empty");
    }
    if (dimension_ == 0) {
        throw std::invalid_argument("Embedding dimension must be positive");
    }

    table_ = schema + ".embeddings";

    db_.execute(
        "INSERT INTO " + schema + ".embedding_sections (section, dimension) VALUES ($1, $2) "
        "ON CONFLICT (section) DO NOTHING",
        {section_, std::to_string(dimension_)});

    auto stored = db_.query_single(
        "SELECT dimension FROM " + schema + ".embedding_sections WHERE section = $1", {section_});
    if (!stored) {
        throw StoreError("Embedding section '" + section_ + "' missing after registration");
    }
    size_t stored_dim = std::stoull(*stored);
    if (stored_dim != dimension_) {
        throw DimensionMismatchError(stored_dim, dimension_, "section '" + section_ + "'");
    }
}

void EmbeddingStore::check_dimension(size_t actual, const std::string& context) const {
    if (actual != dimension_) {
        throw DimensionMismatchError(dimension_, actual, context);
    }
}

void EmbeddingStore::put(const std::string& key, const std::vector<float>& vector) {
    check_dimension(vector.size(), "key '" + key + "'");

    db_.execute(
        "INSERT INTO " + table_ + " (section, key, vector) VALUES ($1, $2, $3::bytea) "
        "ON CONFLICT (section, key) DO UPDATE SET vector = EXCLUDED.vector",
        {section_, key, floats_to_bytea_hex(vector)});
}

std::optional<std::vector<float>> EmbeddingStore::get(const std::string& key) {
    auto stored = db_.query_single(
        "SELECT vector FROM " + table_ + " WHERE section = $1 AND key = $2", {section_, key});
    if (!stored) return std::nullopt;

    auto vector = bytea_hex_to_floats(*stored);
    check_dimension(vector.size(), "stored key '" + key + "'");
    return vector;
}

bool EmbeddingStore::remove(const std::string& key) {
    auto removed = db_.query_single(
        "DELETE FROM " + table_ + " WHERE section = $1 AND key = $2 RETURNING 1", {section_, key});
    return removed.has_value();
}

size_t EmbeddingStore::size() {
    auto n = db_.query_single("SELECT count(*) FROM " + table_ + " WHERE section = $1", {section_});
    return n ? static_cast<size_t>(std::stoull(*n)) : 0;
}

std::vector<ScoredKey> EmbeddingStore::find_similar(const std::vector<float>& query, size_t k) {
    check_dimension(query.size(), "query");

    TopK top(k);
    size_t scanned = 0;

    PostgresConnection::Transaction txn(db_, "BEGIN ISOLATION LEVEL REPEATABLE READ READ ONLY");
    db_.stream_query(
        "SELECT key, vector FROM " + table_ + " WHERE section = $1",
        {section_},
        [&](const PostgresConnection::Row& row) {
            auto stored = bytea_hex_to_floats(row[1]);
            check_dimension(stored.size(), "stored key '" + row[0] + "'");
            top.push(row[0], cosine_similarity(query, stored));
            ++scanned;
        });
    txn.commit();

    Logger::debug("find_similar scanned " + std::to_string(scanned) + " vectors in section " + section_);
    return top.take();
}

} // namespace WikiCorpus

/**
 * @file embedding_store.hpp
 * @brief Persistent key -> vector section with brute-force cosine search
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <vector/similarity.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace WikiCorpus {

/**
 * @brief One named section of the embeddings table.
 *
 * Vectors are stored as little-endian float32 bytes. The section's dimension
 * is recorded the first time it is opened and never changes.
 *
 * find_similar() scans every stored vector (O(N * D) per query) inside one
 * read-only REPEATABLE READ transaction, so it sees a consistent snapshot and
 * does not block writers.
 */
class EmbeddingStore {
public:
    /**
     * @throws DimensionMismatchError if the section exists with another dimension
     */
    EmbeddingStore(PostgresConnection& db, std::string schema, std::string section, size_t dimension);

    /**
     * @brief Insert or replace; committed when this returns (outside a caller transaction).
     * @throws DimensionMismatchError if vector.size() != dimension()
     */
    void put(const std::string& key, const std::vector<float>& vector);

    std::optional<std::vector<float>> get(const std::string& key);

    /**
     * @return true if a vector was removed
     */
    bool remove(const std::string& key);

    size_t size();

    /**
     * @brief The k most similar keys, best first. Ties are unordered.
     * @throws DimensionMismatchError if the query or any stored vector has the
     *         wrong dimension; no partial ranking is returned
     */
    std::vector<ScoredKey> find_similar(const std::vector<float>& query, size_t k);

    size_t dimension() const { return dimension_; }
    const std::string& section() const { return section_; }

private:
    void check_dimension(size_t actual, const std::string& context) const;

    PostgresConnection& db_;
    std::string table_;
    std::string section_;
    size_t dimension_;
};

} // namespace WikiCorpus

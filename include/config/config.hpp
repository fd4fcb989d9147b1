/**
 * @file config.hpp
 * @brief Runtime configuration from environment variables or a JSON file
 */

#pragma once

#include <utils/logger.hpp>
#include <cstddef>
#include <string>

namespace WikiCorpus {

/**
 * @brief Settings shared by the ingest tool, the store classes and the tests.
 *
 * Environment keys:
 *   PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD   (libpq connection)
 *   WIKICORPUS_CONNINFO           overrides the assembled connection string
 *   WIKICORPUS_SCHEMA             schema holding the corpus tables
 *   WIKICORPUS_WORKERS            ingestion worker threads
 *   WIKICORPUS_SUB_BATCH          records per worker transaction
 *   WIKICORPUS_BATCH              records handed to the coordinator at once
 *   WIKICORPUS_TS_CONFIG          text search configuration
 *   WIKICORPUS_EMBEDDING_SECTION  embedding section name
 *   WIKICORPUS_EMBEDDING_DIM      embedding dimension
 *   WIKICORPUS_LOG_LEVEL          debug | info | warn | error
 *
 * JSON files use the same names in lower case without the prefix
 * ("conninfo", "schema", "workers", "sub_batch", "batch", "ts_config",
 * "embedding_section", "embedding_dim", "log_level").
 */
struct CorpusConfig {
    std::string conninfo;
    std::string schema = "wikicorpus";
    size_t workers = 1;
    size_t sub_batch_size = 100;
    size_t pipeline_batch_size = 10000;
    std::string ts_config = "english";
    std::string embedding_section = "vectors";
    size_t embedding_dim = 1536;
    Logger::Level log_level = Logger::Level::Info;

    CorpusConfig();

    static CorpusConfig load_from_env();

    /**
     * @brief Environment defaults overlaid with the keys present in a JSON object.
     * @throws std::invalid_argument on unreadable file, bad JSON or bad values
     */
    static CorpusConfig load_file(const std::string& path);

    /**
     * @throws std::invalid_argument if any value is out of range
     */
    void validate() const;

    /**
     * @brief Apply log_level to the process-wide Logger.
     */
    void apply_logging() const;
};

/**
 * @brief True for names matching [a-z_][a-z0-9_]*
 */
bool is_simple_identifier(const std::string& name);

} // namespace WikiCorpus

/**
 * @file config.cpp
 * @brief CorpusConfig loading and validation
 */

#include <config/config.hpp>
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace WikiCorpus {

namespace {

const char* env_or(const char* name, const char* fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : fallback;
}

// libpq keyword/value syntax: empty values and values with special
// characters are single-quoted, with ' and \ backslash-escaped.
void append_conninfo(std::ostringstream& ss, const char* key, const std::string& value) {
    if (ss.tellp() > 0) ss << ' ';
    ss << key << '=';

    bool plain = !value.empty();
    for (char c : value) {
        if (c == '\'' || c == '\\' || std::isspace(static_cast<unsigned char>(c))) {
            plain = false;
            break;
        }
    }
    if (plain) {
        ss << value;
        return;
    }

    ss << '\'';
    for (char c : value) {
        if (c == '\'' || c == '\\') ss << '\\';
        ss << c;
    }
    ss << '\'';
}

size_t parse_count(const std::string& key, const std::string& value) {
    size_t pos = 0;
    unsigned long long n = 0;
    try {
        n = std::stoull(value, &pos);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(key + " is not a number: '" + value + "'");
    }
    if (pos != value.size() || value[0] == '-') {
        throw std::invalid_argument(key + " is not a number: '" + value + "'");
    }
    return static_cast<size_t>(n);
}

Logger::Level parse_log_level(const std::string& key, const std::string& value) {
    Logger::Level level;
    if (!Logger::parse_level(value, level)) {
        throw std::invalid_argument(key + " must be debug, info, warn or error, got '" + value + "'");
    }
    return level;
}

std::string json_string(const nlohmann::json& doc, const char* key) {
    const auto& v = doc.at(key);
    if (!v.is_string()) {
        throw std::invalid_argument(std::string("config key '") + key + "' must be a string");
    }
    return v.get<std::string>();
}

size_t json_count(const nlohmann::json& doc, const char* key) {
    const auto& v = doc.at(key);
    if (!v.is_number_integer() || v.get<long long>() < 0) {
        throw std::invalid_argument(std::string("config key '") + key + "' must be a non-negative integer");
    }
    return v.get<size_t>();
}

} // namespace

CorpusConfig::CorpusConfig() {
    unsigned hw = std::thread::hardware_concurrency();
    workers = hw > 0 ? hw : 1;
}

CorpusConfig CorpusConfig::load_from_env() {
    CorpusConfig config;

    if (const char* conninfo = std::getenv("WIKICORPUS_CONNINFO"); conninfo && *conninfo) {
        config.conninfo = conninfo;
    } else {
        std::ostringstream ss;
        append_conninfo(ss, "host", env_or("PGHOST", "localhost"));
        append_conninfo(ss, "port", env_or("PGPORT", "5432"));
        append_conninfo(ss, "dbname", env_or("PGDATABASE", "wikicorpus"));
        append_conninfo(ss, "user", env_or("PGUSER", "postgres"));
        if (const char* password = std::getenv("PGPASSWORD"); password && *password) {
            append_conninfo(ss, "password", password);
        }
        config.conninfo = ss.str();
    }

    if (const char* v = std::getenv("WIKICORPUS_SCHEMA")) config.schema = v;
    if (const char* v = std::getenv("WIKICORPUS_WORKERS")) config.workers = parse_count("WIKICORPUS_WORKERS", v);
    if (const char* v = std::getenv("WIKICORPUS_SUB_BATCH")) config.sub_batch_size = parse_count("WIKICORPUS_SUB_BATCH", v);
    if (const char* v = std::getenv("WIKICORPUS_BATCH")) config.pipeline_batch_size = parse_count("WIKICORPUS_BATCH", v);
    if (const char* v = std::getenv("WIKICORPUS_TS_CONFIG")) config.ts_config = v;
    if (const char* v = std::getenv("WIKICORPUS_EMBEDDING_SECTION")) config.embedding_section = v;
    if (const char* v = std::getenv("WIKICORPUS_EMBEDDING_DIM")) config.embedding_dim = parse_count("WIKICORPUS_EMBEDDING_DIM", v);
    if (const char* v = std::getenv("WIKICORPUS_LOG_LEVEL")) config.log_level = parse_log_level("WIKICORPUS_LOG_LEVEL", v);

    config.validate();
    return config;
}

CorpusConfig CorpusConfig::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::invalid_argument("Cannot open config file: " + path);
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Invalid JSON in " + path + ": " + e.what());
    }

    if (!doc.is_object()) {
        throw std::invalid_argument("Config file " + path + " must contain a JSON object");
    }

    CorpusConfig config = load_from_env();

    if (doc.contains("conninfo")) config.conninfo = json_string(doc, "conninfo");
    if (doc.contains("schema")) config.schema = json_string(doc, "schema");
    if (doc.contains("workers")) config.workers = json_count(doc, "workers");
    if (doc.contains("sub_batch")) config.sub_batch_size = json_count(doc, "sub_batch");
    if (doc.contains("batch")) config.pipeline_batch_size = json_count(doc, "batch");
    if (doc.contains("ts_config")) config.ts_config = json_string(doc, "ts_config");
    if (doc.contains("embedding_section")) config.embedding_section = json_string(doc, "embedding_section");
    if (doc.contains("embedding_dim")) config.embedding_dim = json_count(doc, "embedding_dim");
    if (doc.contains("log_level")) config.log_level = parse_log_level("log_level", json_string(doc, "log_level"));

    config.validate();
    return config;
}

void CorpusConfig::validate() const {
    if (workers == 0) throw std::invalid_argument("workers must be positive");
    if (sub_batch_size == 0) throw std::invalid_argument("sub_batch must be positive");
    if (pipeline_batch_size == 0) throw std::invalid_argument("batch must be positive");
    if (embedding_dim == 0) throw std::invalid_argument("embedding_dim must be positive");
    if (!is_simple_identifier(schema)) throw std::invalid_argument("schema is not a simple identifier: '" + schema + "'");
    if (!is_simple_identifier(ts_config)) throw std::invalid_argument("ts_config is not a simple identifier: '" + ts_config + "'");
    if (!is_simple_identifier(embedding_section)) {
        throw std::invalid_argument("embedding_section is not a simple identifier: '" + embedding_section + "'");
    }
}

void CorpusConfig::apply_logging() const {
    Logger::set_level(log_level);
}

bool is_simple_identifier(const std::string& name) {
    if (name.empty() || name.size() > 63) return false;
    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        bool ok = (c >= 'a' && c <= 'z') || c == '_' || (i > 0 && c >= '0' && c <= '9');
        if (!ok) return false;
    }
    return true;
}

} // namespace WikiCorpus

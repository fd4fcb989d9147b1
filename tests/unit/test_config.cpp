/**
 * @file test_config.cpp
 * @brief Unit tests for environment and JSON configuration
 */

#include <gtest/gtest.h>
#include <config/config.hpp>
#include <libpq-fe.h>
#include <cstdlib>
#include <fstream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

using namespace WikiCorpus;

namespace {

const char* k_vars[] = {
    "PGHOST", "PGPORT", "PGDATABASE", "PGUSER", "PGPASSWORD",
    "WIKICORPUS_CONNINFO", "WIKICORPUS_SCHEMA", "WIKICORPUS_WORKERS", "WIKICORPUS_SUB_BATCH",
    "WIKICORPUS_BATCH", "WIKICORPUS_TS_CONFIG", "WIKICORPUS_EMBEDDING_SECTION",
    "WIKICORPUS_EMBEDDING_DIM", "WIKICORPUS_LOG_LEVEL"
};

// Clears every variable the loader reads and restores them afterwards
class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : k_vars) {
            if (const char* v = std::getenv(name)) saved_[name] = v;
            unsetenv(name);
        }
    }

    void TearDown() override {
        for (const char* name : k_vars) {
            auto it = saved_.find(name);
            if (it != saved_.end()) setenv(name, it->second.c_str(), 1);
            else unsetenv(name);
        }
    }

    std::string write_file(const std::string& name, const std::string& body) {
        std::string path = ::testing::TempDir() + name;
        std::ofstream out(path);
        out << body;
        return path;
    }

private:
    std::map<std::string, std::string> saved_;
};

} // namespace

TEST_F(ConfigTest, Defaults) {
    CorpusConfig config = CorpusConfig::load_from_env();

    EXPECT_EQ(config.conninfo, "host=localhost port=5432 dbname=wikicorpus user=postgres");
    EXPECT_EQ(config.schema, "wikicorpus");
    EXPECT_GE(config.workers, 1u);
    EXPECT_EQ(config.sub_batch_size, 100u);
    EXPECT_EQ(config.pipeline_batch_size, 10000u);
    EXPECT_EQ(config.ts_config, "english");
    EXPECT_EQ(config.embedding_section, "vectors");
    EXPECT_EQ(config.embedding_dim, 1536u);
    EXPECT_EQ(config.log_level, Logger::Level::Info);
}

TEST_F(ConfigTest, LibpqVariables) {
    setenv("PGHOST", "db.internal", 1);
    setenv("PGPORT", "6543", 1);
    setenv("PGDATABASE", "wiki", 1);
    setenv("PGUSER", "ingest", 1);
    setenv("PGPASSWORD", "secret", 1);

    CorpusConfig config = CorpusConfig::load_from_env();
    EXPECT_EQ(config.conninfo, "host=db.internal port=6543 dbname=wiki user=ingest password=secret");
}

TEST_F(ConfigTest, LibpqVariablesWithSpecialCharactersAreQuoted) {
    setenv("PGUSER", "wiki user", 1);
    setenv("PGPASSWORD", "s3cret pass'\\x", 1);

    CorpusConfig config = CorpusConfig::load_from_env();
    EXPECT_EQ(config.conninfo,
              "host=localhost port=5432 dbname=wikicorpus user='wiki user' password='s3cret pass\\'\\\\x'");

    char* err = nullptr;
    PQconninfoOption* options = PQconninfoParse(config.conninfo.c_str(), &err);
    ASSERT_NE(options, nullptr) << (err ? err : "");

    std::map<std::string, std::string> parsed;
    for (PQconninfoOption* o = options; o->keyword; ++o) {
        if (o->val) parsed[o->keyword] = o->val;
    }
    PQconninfoFree(options);

    EXPECT_EQ(parsed["user"], "wiki user");
    EXPECT_EQ(parsed["password"], "s3cret pass'\\x");
    EXPECT_EQ(parsed["host"], "localhost");
}

TEST_F(ConfigTest, ExplicitConninfoWins) {
    setenv("PGHOST", "ignored", 1);
    setenv("WIKICORPUS_CONNINFO", "postgresql:///wiki", 1);

    EXPECT_EQ(CorpusConfig::load_from_env().conninfo, "postgresql:///wiki");
}

TEST_F(ConfigTest, ProjectVariables) {
    setenv("WIKICORPUS_SCHEMA", "enwiki", 1);
    setenv("WIKICORPUS_WORKERS", "8", 1);
    setenv("WIKICORPUS_SUB_BATCH", "250", 1);
    setenv("WIKICORPUS_BATCH", "5000", 1);
    setenv("WIKICORPUS_TS_CONFIG", "simple", 1);
    setenv("WIKICORPUS_EMBEDDING_SECTION", "minilm", 1);
    setenv("WIKICORPUS_EMBEDDING_DIM", "384", 1);
    setenv("WIKICORPUS_LOG_LEVEL", "debug", 1);

    CorpusConfig config = CorpusConfig::load_from_env();
    EXPECT_EQ(config.schema, "enwiki");
    EXPECT_EQ(config.workers, 8u);
    EXPECT_EQ(config.sub_batch_size, 250u);
    EXPECT_EQ(config.pipeline_batch_size, 5000u);
    EXPECT_EQ(config.ts_config, "simple");
    EXPECT_EQ(config.embedding_section, "minilm");
    EXPECT_EQ(config.embedding_dim, 384u);
    EXPECT_EQ(config.log_level, Logger::Level::Debug);
}

TEST_F(ConfigTest, RejectsBadValues) {
    setenv("WIKICORPUS_WORKERS", "0", 1);
    EXPECT_THROW(CorpusConfig::load_from_env(), std::invalid_argument);

    setenv("WIKICORPUS_WORKERS", "four", 1);
    EXPECT_THROW(CorpusConfig::load_from_env(), std::invalid_argument);

    setenv("WIKICORPUS_WORKERS", "-2", 1);
    EXPECT_THROW(CorpusConfig::load_from_env(), std::invalid_argument);
    unsetenv("WIKICORPUS_WORKERS");

    setenv("WIKICORPUS_SCHEMA", "bad-name; DROP", 1);
    EXPECT_THROW(CorpusConfig::load_from_env(), std::invalid_argument);
    unsetenv("WIKICORPUS_SCHEMA");

    setenv("WIKICORPUS_LOG_LEVEL", "verbose", 1);
    EXPECT_THROW(CorpusConfig::load_from_env(), std::invalid_argument);
}

TEST_F(ConfigTest, JsonFileOverridesEnvironment) {
    setenv("WIKICORPUS_WORKERS", "2", 1);
    std::string path = write_file("wikicorpus_config.json", R"({
        "conninfo": "host=json",
        "schema": "from_json",
        "sub_batch": 50,
        "embedding_dim": 768,
        "log_level": "warn"
    })");

    CorpusConfig config = CorpusConfig::load_file(path);
    EXPECT_EQ(config.conninfo, "host=json");
    EXPECT_EQ(config.schema, "from_json");
    EXPECT_EQ(config.workers, 2u);
    EXPECT_EQ(config.sub_batch_size, 50u);
    EXPECT_EQ(config.embedding_dim, 768u);
    EXPECT_EQ(config.log_level, Logger::Level::Warning);
}

TEST_F(ConfigTest, JsonErrors) {
    EXPECT_THROW(CorpusConfig::load_file("/nonexistent/config.json"), std::invalid_argument);
    EXPECT_THROW(CorpusConfig::load_file(write_file("bad.json", "{ not json")), std::invalid_argument);
    EXPECT_THROW(CorpusConfig::load_file(write_file("array.json", "[1, 2]")), std::invalid_argument);
    EXPECT_THROW(CorpusConfig::load_file(write_file("type.json", R"({"workers": "many"})")), std::invalid_argument);
    EXPECT_THROW(CorpusConfig::load_file(write_file("neg.json", R"({"workers": -1})")), std::invalid_argument);
}

TEST(IdentifierTest, SimpleIdentifiers) {
    EXPECT_TRUE(is_simple_identifier("wikicorpus"));
    EXPECT_TRUE(is_simple_identifier("_test_42"));
    EXPECT_FALSE(is_simple_identifier(""));
    EXPECT_FALSE(is_simple_identifier("1abc"));
    EXPECT_FALSE(is_simple_identifier("Upper"));
    EXPECT_FALSE(is_simple_identifier("a-b"));
    EXPECT_FALSE(is_simple_identifier(std::string(64, 'a')));
}

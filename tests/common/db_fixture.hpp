/**
 * @file db_fixture.hpp
 * @brief Shared fixture for tests that need a PostgreSQL server
 *
 * Connects with WIKICORPUS_TEST_CONNINFO, falling back to the libpq
 * environment. Each test gets a freshly created schema with a unique name
 * that is dropped in TearDown. Tests skip when no server is reachable.
 */

#pragma once

#include <gtest/gtest.h>
#include <config/config.hpp>
#include <database/postgres_connection.hpp>
#include <parser/article.hpp>
#include <storage/corpus_schema.hpp>
#include <utils/errors.hpp>
#include <atomic>
#include <cstdlib>
#include <memory>
#include <string>
#include <unistd.h>

namespace WikiCorpus::test_support {

inline std::string test_conninfo() {
    if (const char* c = std::getenv("WIKICORPUS_TEST_CONNINFO"); c && *c) return c;
    return CorpusConfig::load_from_env().conninfo;
}

inline std::string unique_schema_name() {
    static std::atomic<int> counter{0};
    return "wikicorpus_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++);
}

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        conninfo_ = test_conninfo();
        try {
            db_ = std::make_unique<PostgresConnection>(conninfo_);
        } catch (const StoreError& e) {
            GTEST_SKIP() << "Database not available - skipping integration test: " << e.what();
        }
        Logger::set_level(Logger::Level::Warning);

        schema_name_ = unique_schema_name();
        schema_ = std::make_unique<CorpusSchema>(*db_, schema_name_);
        schema_->initialize();
    }

    void TearDown() override {
        if (schema_) {
            schema_->drop();
        }
    }

    std::unique_ptr<PostgresConnection> connect() const {
        return std::make_unique<PostgresConnection>(conninfo_);
    }

    std::string conninfo_;
    std::string schema_name_;
    std::unique_ptr<PostgresConnection> db_;
    std::unique_ptr<CorpusSchema> schema_;
};

inline Article make_article(const std::string& title, const std::string& content,
                            std::set<std::string> categories = {}, std::vector<ImageRef> images = {}) {
    Article a;
    a.title = title;
    a.content = content;
    a.size = content.size();
    a.last_modified = *parse_iso8601("2024-01-15T10:30:00Z");
    a.categories = std::move(categories);
    a.images = std::move(images);
    return a;
}

inline Article make_redirect(const std::string& title, const std::string& target) {
    Article a;
    a.title = title;
    a.last_modified = *parse_iso8601("2024-01-15T10:30:00Z");
    a.is_redirect = true;
    a.redirect_target = target;
    return a;
}

} // namespace WikiCorpus::test_support

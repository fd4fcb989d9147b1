/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <libpq-fe.h>

namespace WikiCorpus {

/**
 * @brief PostgreSQL connection wrapper
 *
 * Every failure is reported as StoreError carrying the server's SQLSTATE.
 * Not thread-safe: each worker owns its own connection.
 */
class PostgresConnection {
public:
    using Row = std::vector<std::string>;
    using RowCallback = std::function<void(const Row&)>;

    /**
     * @brief Connect with explicit connection string
     * (CorpusConfig::load_from_env() assembles one from PG* variables)
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    // No copy
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    // Move OK
    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    bool is_connected() const;

    /**
     * @brief Execute statement (no results expected)
     */
    void execute(const std::string& sql);

    void execute(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query and return the first column of the first row
     */
    std::optional<std::string> query_single(const std::string& sql);

    std::optional<std::string> query_single(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query and iterate rows
     * @param callback Called for each row: callback(row_data)
     */
    void query(const std::string& sql, const RowCallback& callback);

    void query(const std::string& sql, const std::vector<std::string>& params, const RowCallback& callback);

    /**
     * @brief Iterate rows in single-row mode so large results are never
     * materialised client-side
     */
    void stream_query(const std::string& sql, const std::vector<std::string>& params, const RowCallback& callback);

    void begin(const std::string& begin_sql = "BEGIN");
    void commit();
    void rollback();

    /**
     * @brief RAII transaction guard, rolls back unless committed
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn, const std::string& begin_sql = "BEGIN");
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();
        void rollback();

    private:
        PostgresConnection& conn_;
        bool done_ = false;
    };

private:
    void connect(const std::string& conninfo);
    void disconnect();
    void ensure_connected() const;
    void check_result(PGresult* result);
    PGresult* exec_params(const std::string& sql, const std::vector<std::string>& params);
    bool try_rollback() noexcept;

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

} // namespace WikiCorpus

/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <utils/errors.hpp>
#include <exception>

namespace WikiCorpus {

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

PostgresConnection::PostgresConnection(PostgresConnection&& other) noexcept
    : conn_(other.conn_), last_error_(std::move(other.last_error_)) {
    other.conn_ = nullptr;
}

PostgresConnection& PostgresConnection::operator=(PostgresConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        conn_ = other.conn_;
        last_error_ = std::move(other.last_error_);
        other.conn_ = nullptr;
    }
    return *this;
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw StoreError("PostgreSQL connection failed: " + last_error_);
    }
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void PostgresConnection::ensure_connected() const {
    if (!is_connected()) {
        throw StoreError("Not connected to database");
    }
}

void PostgresConnection::check_result(PGresult* result) {
    ExecStatusType status = PQresultStatus(result);

    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK &&
        status != PGRES_SINGLE_TUPLE) {
        last_error_ = PQerrorMessage(conn_);
        const char* state = result ? PQresultErrorField(result, PG_DIAG_SQLSTATE) : nullptr;
        std::string sql_state = state ? state : "";
        PQclear(result);
        throw StoreError("PostgreSQL query failed: " + last_error_, sql_state);
    }
}

PGresult* PostgresConnection::exec_params(const std::string& sql, const std::vector<std::string>& params) {
    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p.c_str());
    }

    return PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        param_values.data(),
        nullptr,
        nullptr,
        0  // Text format
    );
}

void PostgresConnection::execute(const std::string& sql) {
    ensure_connected();

    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result);
    PQclear(result);
}

void PostgresConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    ensure_connected();

    PGresult* result = exec_params(sql, params);
    check_result(result);
    PQclear(result);
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql) {
    return query_single(sql, {});
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql, const std::vector<std::string>& params) {
    ensure_connected();

    PGresult* result = exec_params(sql, params);
    check_result(result);

    std::optional<std::string> value;

    if (PQntuples(result) > 0 && PQnfields(result) > 0 && !PQgetisnull(result, 0, 0)) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

void PostgresConnection::query(const std::string& sql, const RowCallback& callback) {
    query(sql, {}, callback);
}

void PostgresConnection::query(const std::string& sql, const std::vector<std::string>& params,
                               const RowCallback& callback) {
    ensure_connected();

    PGresult* result = exec_params(sql, params);
    check_result(result);

    int nrows = PQntuples(result);
    int nfields = PQnfields(result);

    try {
        for (int i = 0; i < nrows; ++i) {
            Row row;
            row.reserve(nfields);

            for (int j = 0; j < nfields; ++j) {
                row.push_back(PQgetvalue(result, i, j));
            }

            callback(row);
        }
    } catch (...) {
        PQclear(result);
        throw;
    }

    PQclear(result);
}

void PostgresConnection::stream_query(const std::string& sql, const std::vector<std::string>& params,
                                      const RowCallback& callback) {
    ensure_connected();

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p.c_str());
    }

    if (PQsendQueryParams(conn_, sql.c_str(), static_cast<int>(params.size()), nullptr,
                          param_values.data(), nullptr, nullptr, 0) == 0) {
        last_error_ = PQerrorMessage(conn_);
        throw StoreError("PQsendQueryParams failed: " + last_error_);
    }

    if (PQsetSingleRowMode(conn_) == 0) {
        throw StoreError("PQsetSingleRowMode failed");
    }

    // Results must be drained even after a failure, or the connection stays busy
    std::exception_ptr failure;
    PGresult* res;
    while ((res = PQgetResult(conn_)) != nullptr) {
        if (failure) {
            PQclear(res);
            continue;
        }

        ExecStatusType status = PQresultStatus(res);
        try {
            if (status == PGRES_SINGLE_TUPLE) {
                int nfields = PQnfields(res);
                Row row;
                row.reserve(nfields);
                for (int i = 0; i < nfields; ++i) {
                    row.push_back(PQgetvalue(res, 0, i));
                }
                PQclear(res);
                callback(row);
            } else if (status == PGRES_TUPLES_OK) {
                // PGRES_TUPLES_OK marks the end of the result set
                PQclear(res);
            } else {
                check_result(res);  // throws and clears
                PQclear(res);
            }
        } catch (...) {
            failure = std::current_exception();
        }
    }

    if (failure) std::rethrow_exception(failure);
}

void PostgresConnection::begin(const std::string& begin_sql) {
    execute(begin_sql);
}

void PostgresConnection::commit() {
    execute("COMMIT");
}

void PostgresConnection::rollback() {
    execute("ROLLBACK");
}

bool PostgresConnection::try_rollback() noexcept {
    if (!conn_) return false;
    PGresult* result = PQexec(conn_, "ROLLBACK");
    bool ok = PQresultStatus(result) == PGRES_COMMAND_OK;
    PQclear(result);
    return ok;
}

// Transaction RAII
PostgresConnection::Transaction::Transaction(PostgresConnection& conn, const std::string& begin_sql) : conn_(conn) {
    conn_.begin(begin_sql);
}

PostgresConnection::Transaction::~Transaction() {
    if (!done_) {
        conn_.try_rollback();
    }
}

void PostgresConnection::Transaction::commit() {
    done_ = true;
    conn_.commit();
}

void PostgresConnection::Transaction::rollback() {
    done_ = true;
    conn_.rollback();
}

} // namespace WikiCorpus

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace WikiCorpus {

/**
 * @brief Root of every error raised by the corpus core.
 */
class CorpusError : public std::runtime_error {
public:
    explicit CorpusError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Malformed bytes or bad structural nesting in the dump stream.
 *
 * Aborts the whole parse; no partial document is emitted.
 */
class StreamError : public CorpusError {
public:
    StreamError(const std::string& msg, size_t line = 0, size_t column = 0)
        : CorpusError(line ? msg + " (line " + std::to_string(line) + ", column " + std::to_string(column) + ")" : msg),
          line_(line), column_(column) {}

    size_t line() const { return line_; }
    size_t column() const { return column_; }

private:
    size_t line_;
    size_t column_;
};

/**
 * @brief A single record violates a field invariant.
 */
class ValidationError : public CorpusError {
public:
    ValidationError(const std::string& msg, std::string title = {})
        : CorpusError(msg), title_(std::move(title)) {}

    const std::string& title() const { return title_; }

private:
    std::string title_;
};

/**
 * @brief I/O failure or constraint violation reported by the database.
 */
class StoreError : public CorpusError {
public:
    explicit StoreError(const std::string& msg, std::string sql_state = {})
        : CorpusError(msg), sql_state_(std::move(sql_state)) {}

    /**
     * @brief Five-character SQLSTATE, empty when not reported by the server.
     */
    const std::string& sql_state() const { return sql_state_; }

    bool is_unique_violation() const { return sql_state_ == "23505"; }

private:
    std::string sql_state_;
};

/**
 * @brief Vector dimension differs from the dimension fixed for the store.
 */
class DimensionMismatchError : public CorpusError {
public:
    DimensionMismatchError(size_t expected, size_t actual, const std::string& context = {})
        : CorpusError("Dimension mismatch" + (context.empty() ? std::string() : " for " + context) +
                      ": expected " + std::to_string(expected) + ", got " + std::to_string(actual)),
          expected_(expected), actual_(actual) {}

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

/**
 * @brief Rethrow-friendly copy of an error with context prepended, keeping its type.
 */
inline StoreError with_context(const StoreError& e, const std::string& ctx) {
    return StoreError(ctx + ": " + e.what(), e.sql_state());
}

inline ValidationError with_context(const ValidationError& e, const std::string& ctx) {
    return ValidationError(ctx + ": " + e.what(), e.title());
}

} // namespace WikiCorpus

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <sqlite3.h>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tandem::storage {

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    // Bind helpers
    Result<void> bind_text(int index, std::string_view text);
    Result<void> bind_int(int index, int value);
    Result<void> bind_int64(int index, int64_t value);
    Result<void> bind_double(int index, double value);
    Result<void> bind_blob(int index, const Bytes& data);
    Result<void> bind_null(int index);

    // Column getters
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] double column_double(int index) const;
    [[nodiscard]] Bytes column_blob(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    // Execute
    Result<bool> step();  // true if there's a row
    Result<void> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - SQLite connection wrapper.
 *
 * Every failure is reported as ErrorCode::Storage with the SQLite message.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    [[nodiscard]] Result<Statement> prepare(std::string_view sql);

    /**
     * Execute one or more statements without results.
     */
    [[nodiscard]] Result<void> execute(const std::string& sql);

    [[nodiscard]] Result<void> begin_transaction();
    [[nodiscard]] Result<void> commit();
    [[nodiscard]] Result<void> rollback();

    /**
     * Execute a function within a transaction.
     * Commits on success, rolls back on failure.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            (void)rollback();  // report the original error
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            return ResultType::err(commit_result.unwrap_err());
        }

        return result;
    }

    [[nodiscard]] int changes() const;

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    sqlite3* db_ = nullptr;
};

/**
 * Build a Storage error from an SQLite result code.
 */
[[nodiscard]] Error sqlite_error(std::string_view what, int rc);

} // namespace tandem::storage

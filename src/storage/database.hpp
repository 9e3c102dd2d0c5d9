#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <sqlite3.h>
#include <string>
#include <memory>
#include <string_view>

namespace weave::storage {

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_int64(int index, int64_t value);
    Result<void, Error> bind_blob(int index, const Bytes& blob);

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] Bytes column_blob(int index) const;

    // true while a row is available
    Result<bool, Error> step();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - owning SQLite connection.
 *
 * Opened in WAL mode with a busy timeout, since the cache may be touched by
 * a second weave process on the same machine.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database, Error> open(const std::string& path);
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    void close();

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Run f() between BEGIN and COMMIT; roll back if it returns an error.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = execute("BEGIN IMMEDIATE;");
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();
        if (result.is_err()) {
            // The original error is what the caller needs; a failed rollback
            // leaves SQLite to roll back when the connection closes.
            (void)execute("ROLLBACK;");
            return result;
        }

        auto commit_result = execute("COMMIT;");
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

} // namespace weave::storage

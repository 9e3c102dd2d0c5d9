#include "storage/database.hpp"

namespace weave::storage {

namespace {

constexpr int kBusyTimeoutMs = 2000;

Result<void, Error> check_bind(sqlite3_stmt* stmt, int rc, const char* what) {
    if (rc != SQLITE_OK) {
        std::string msg = std::string("Failed to bind ") + what;
        if (sqlite3* db = sqlite3_db_handle(stmt)) {
            msg += ": ";
            msg += sqlite3_errmsg(db);
        }
        return Result<void, Error>::err(Error{msg, rc});
    }
    return Result<void, Error>::ok();
}

} // namespace

// ============================================================================
// Statement
// ============================================================================

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    return check_bind(stmt_.get(),
                      sqlite3_bind_text(stmt_.get(), index, text.data(),
                                        static_cast<int>(text.size()), SQLITE_TRANSIENT),
                      "text");
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    return check_bind(stmt_.get(), sqlite3_bind_int64(stmt_.get(), index, value), "int64");
}

Result<void, Error> Statement::bind_blob(int index, const Bytes& blob) {
    // sqlite treats a null pointer as NULL; bind empty blobs as zero-length instead.
    static const uint8_t empty = 0;
    const void* data = blob.empty() ? static_cast<const void*>(&empty) : blob.data();
    return check_bind(stmt_.get(),
                      sqlite3_bind_blob(stmt_.get(), index, data,
                                        static_cast<int>(blob.size()), SQLITE_TRANSIENT),
                      "blob");
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return reinterpret_cast<const char*>(text);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

Bytes Statement::column_blob(int index) const {
    const void* data = sqlite3_column_blob(stmt_.get(), index);
    int size = sqlite3_column_bytes(stmt_.get(), index);
    if (!data || size <= 0) return {};

    const auto* bytes = static_cast<const uint8_t*>(data);
    return Bytes(bytes, bytes + size);
}

Result<bool, Error> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    return Result<bool, Error>::err(
        Error{std::string("Step failed: ") + (db ? sqlite3_errmsg(db) : "unknown"), rc});
}

// ============================================================================
// Database
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open(path.c_str(), &raw);
    if (rc != SQLITE_OK) {
        std::string error = raw ? sqlite3_errmsg(raw) : "Unknown error";
        if (raw) sqlite3_close(raw);
        return Result<Database, Error>::err(Error{"Cannot open " + path + ": " + error, rc});
    }

    Database db(raw);
    sqlite3_busy_timeout(raw, kBusyTimeoutMs);

    // In-memory databases report "memory" here; only files need WAL.
    if (path != ":memory:") {
        auto wal = db.execute("PRAGMA journal_mode = WAL;");
        if (wal.is_err()) {
            return Result<Database, Error>::err(wal.unwrap_err());
        }
    }
    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error{last_error(), rc});
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(Error{error, rc});
    }
    return Result<void, Error>::ok();
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace weave::storage

#include "storage/database.hpp"

namespace tandem::storage {

Error sqlite_error(std::string_view what, int rc) {
    return Error{std::string(what) + " (" + sqlite3_errstr(rc) + ")", ErrorCode::Storage};
}

// ============================================================================
// Statement implementation
// ============================================================================

namespace {

Result<void> check_bind(int rc, std::string_view what) {
    if (rc != SQLITE_OK) {
        return Result<void>::err(sqlite_error(what, rc));
    }
    return Result<void>::ok();
}

} // namespace

Result<void> Statement::bind_text(int index, std::string_view text) {
    return check_bind(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                        static_cast<int>(text.size()), SQLITE_TRANSIENT),
                      "Failed to bind text");
}

Result<void> Statement::bind_int(int index, int value) {
    return check_bind(sqlite3_bind_int(stmt_.get(), index, value), "Failed to bind int");
}

Result<void> Statement::bind_int64(int index, int64_t value) {
    return check_bind(sqlite3_bind_int64(stmt_.get(), index, value), "Failed to bind int64");
}

Result<void> Statement::bind_double(int index, double value) {
    return check_bind(sqlite3_bind_double(stmt_.get(), index, value), "Failed to bind double");
}

Result<void> Statement::bind_blob(int index, const Bytes& data) {
    // A zero-length blob must still bind a non-null pointer, or SQLite stores NULL.
    static const uint8_t empty = 0;
    const void* ptr = data.empty() ? static_cast<const void*>(&empty) : data.data();
    return check_bind(sqlite3_bind_blob64(stmt_.get(), index, ptr,
                                          static_cast<sqlite3_uint64>(data.size()),
                                          SQLITE_TRANSIENT),
                      "Failed to bind blob");
}

Result<void> Statement::bind_null(int index) {
    return check_bind(sqlite3_bind_null(stmt_.get(), index), "Failed to bind null");
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

double Statement::column_double(int index) const {
    return sqlite3_column_double(stmt_.get(), index);
}

Bytes Statement::column_blob(int index) const {
    const void* data = sqlite3_column_blob(stmt_.get(), index);
    int size = sqlite3_column_bytes(stmt_.get(), index);
    if (!data || size <= 0) return {};

    const auto* bytes = static_cast<const uint8_t*>(data);
    return Bytes(bytes, bytes + size);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool>::ok(false);
    }
    return Result<bool>::err(sqlite_error("Step failed", rc));
}

Result<void> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void>::err(sqlite_error("Reset failed", rc));
    }
    return Result<void>::ok();
}

// ============================================================================
// Database implementation
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

Result<Database> Database::open(const std::string& path) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error = db ? sqlite3_errmsg(db) : "Unknown error";
        if (db) sqlite3_close(db);
        return Result<Database>::err(Error{"Cannot open " + path + ": " + error, ErrorCode::Storage});
    }

    Database database(db);
    auto pragmas = database.execute("PRAGMA foreign_keys = ON;");
    if (pragmas.is_err()) {
        return Result<Database>::err(pragmas.unwrap_err());
    }
    if (path != ":memory:") {
        // WAL is unsupported for in-memory databases; failure here is not fatal.
        (void)database.execute("PRAGMA journal_mode = WAL;");
    }

    return Result<Database>::ok(std::move(database));
}

Result<Database> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement> Database::prepare(std::string_view sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement>::err(Error{last_error(), ErrorCode::Storage});
    }
    return Result<Statement>::ok(Statement(stmt));
}

Result<void> Database::execute(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void>::err(Error{error, ErrorCode::Storage});
    }
    return Result<void>::ok();
}

Result<void> Database::begin_transaction() {
    return execute("BEGIN TRANSACTION;");
}

Result<void> Database::commit() {
    return execute("COMMIT;");
}

Result<void> Database::rollback() {
    return execute("ROLLBACK;");
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace tandem::storage

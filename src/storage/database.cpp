#include "storage/database.hpp"
#include "core/logging.hpp"

namespace tidesync::storage {

namespace {

Error sqlite_error(std::string_view what, sqlite3* db, int rc) {
    std::string message(what);
    message += ": ";
    message += db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    return Error{std::move(message), ErrorCode::StorageError, rc};
}

Result<void> checked_bind(sqlite3_stmt* stmt, int rc, int index) {
    if (rc == SQLITE_OK) return Result<void>::ok();
    return Result<void>::err(
        sqlite_error("bind ?" + std::to_string(index), sqlite3_db_handle(stmt), rc));
}

} // namespace

Result<void> Statement::bind_text(int index, std::string_view text) {
    return checked_bind(stmt_.get(),
                        sqlite3_bind_text(stmt_.get(), index, text.data(), static_cast<int>(text.size()),
                                          SQLITE_TRANSIENT),
                        index);
}

Result<void> Statement::bind_int(int index, int value) {
    return checked_bind(stmt_.get(), sqlite3_bind_int(stmt_.get(), index, value), index);
}

Result<void> Statement::bind_int64(int index, int64_t value) {
    return checked_bind(stmt_.get(), sqlite3_bind_int64(stmt_.get(), index, value), index);
}

Result<void> Statement::bind_double(int index, double value) {
    return checked_bind(stmt_.get(), sqlite3_bind_double(stmt_.get(), index, value), index);
}

Result<void> Statement::bind_null(int index) {
    return checked_bind(stmt_.get(), sqlite3_bind_null(stmt_.get(), index), index);
}

std::string Statement::column_text(int index) const {
    const auto* text = sqlite3_column_text(stmt_.get(), index);
    if (text == nullptr) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool> Statement::step() {
    switch (int rc = sqlite3_step(stmt_.get())) {
        case SQLITE_ROW: return Result<bool>::ok(true);
        case SQLITE_DONE: return Result<bool>::ok(false);
        default: return Result<bool>::err(sqlite_error("step", sqlite3_db_handle(stmt_.get()), rc));
    }
}

Result<Database> Database::open(const std::string& path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open(path.c_str(), &raw);
    Database database(raw);
    if (rc != SQLITE_OK) {
        return Result<Database>::err(sqlite_error("open " + path, raw, rc));
    }

    auto configured = database.execute(
        "PRAGMA foreign_keys = ON;"
        "PRAGMA journal_mode = WAL;"
        "PRAGMA busy_timeout = 5000;");
    if (configured.is_err()) return Result<Database>::err(configured.unwrap_err());

    qCDebug(tidesyncStorageLog) << "opened" << QString::fromStdString(path);
    return Result<Database>::ok(std::move(database));
}

Result<Database> Database::open_memory() {
    return open(":memory:");
}

Result<Statement> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_.get(), sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement>::err(sqlite_error("prepare", db_.get(), rc));
    }
    return Result<Statement>::ok(Statement(stmt));
}

Result<void> Database::execute(const std::string& sql) {
    char* message = nullptr;
    int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &message);
    if (rc == SQLITE_OK) return Result<void>::ok();

    std::string text = message ? message : sqlite3_errstr(rc);
    sqlite3_free(message);
    return Result<void>::err(Error{std::move(text), ErrorCode::StorageError, rc});
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_.get());
}

int Database::changes() const {
    return sqlite3_changes(db_.get());
}

void Database::abandon_transaction() {
    if (sqlite3_get_autocommit(db_.get())) return;
    auto rolled_back = execute("ROLLBACK;");
    if (rolled_back.is_err()) {
        qCWarning(tidesyncStorageLog) << "rollback failed:" << QString::fromStdString(rolled_back.unwrap_err().message)
                                      << "rc=" << rolled_back.unwrap_err().detail;
    }
}

} // namespace tidesync::storage

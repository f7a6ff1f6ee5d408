#include "sqlite_util.hpp"

namespace hoofy {

void throw_sqlite_error(sqlite3* db, const std::string& context) {
    int code = db ? sqlite3_extended_errcode(db) : SQLITE_ERROR;
    std::string msg = context + ": " + (db ? sqlite3_errmsg(db) : "no database");

    ErrorKind kind = ErrorKind::Internal;
    switch (code) {
        case SQLITE_CONSTRAINT_UNIQUE:
        case SQLITE_CONSTRAINT_PRIMARYKEY:
            kind = ErrorKind::AlreadyExists;
            break;
        case SQLITE_CONSTRAINT_FOREIGNKEY:
            kind = ErrorKind::NotFound;
            break;
        default:
            if ((code & 0xFF) == SQLITE_BUSY || (code & 0xFF) == SQLITE_LOCKED) {
                kind = ErrorKind::Unavailable;
            }
            break;
    }
    throw MemoryError(kind, msg);
}

void exec_sql(sqlite3* db, const char* sql, const std::string& context) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        sqlite3_free(err);
        throw_sqlite_error(db, context);
    }
}

Stmt::Stmt(sqlite3* db, const std::string& sql) : db_(db), sql_(sql) {
    if (sqlite3_prepare_v2(db_, sql_.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        throw_sqlite_error(db_, "prepare");
    }
}

Stmt& Stmt::bind(const std::string& v) {
    sqlite3_bind_text(stmt_, next_index_++, v.c_str(), static_cast<int>(v.size()),
                      SQLITE_TRANSIENT);
    return *this;
}

Stmt& Stmt::bind(const std::optional<std::string>& v) {
    if (!v) return bind_null();
    return bind(*v);
}

Stmt& Stmt::bind(int64_t v) {
    sqlite3_bind_int64(stmt_, next_index_++, v);
    return *this;
}

Stmt& Stmt::bind_null() {
    sqlite3_bind_null(stmt_, next_index_++);
    return *this;
}

bool Stmt::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_sqlite_error(db_, "step");
}

std::string Stmt::column_text(int col) const {
    if (auto* v = sqlite3_column_text(stmt_, col)) {
        return reinterpret_cast<const char*>(v);
    }
    return {};
}

std::optional<std::string> Stmt::column_optional_text(int col) const {
    if (column_is_null(col)) return std::nullopt;
    return column_text(col);
}

Transaction::Transaction(sqlite3* db) : db_(db) {
    exec_sql(db_, "BEGIN IMMEDIATE;", "begin transaction");
}

Transaction::~Transaction() {
    if (!done_) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
}

void Transaction::commit() {
    exec_sql(db_, "COMMIT;", "commit transaction");
    done_ = true;
}

} // namespace hoofy

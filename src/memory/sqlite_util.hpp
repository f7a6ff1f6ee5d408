#pragma once
#include "errors.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <optional>
#include <string>

namespace hoofy {

// Map the connection's last result code to an ErrorKind and throw.
[[noreturn]] void throw_sqlite_error(sqlite3* db, const std::string& context);

// Run one or more statements that return no rows; throws on failure.
void exec_sql(sqlite3* db, const char* sql, const std::string& context);

// RAII wrapper for sqlite3_stmt with 1-based positional binding.
class Stmt {
public:
    Stmt(sqlite3* db, const std::string& sql);
    ~Stmt() { if (stmt_) sqlite3_finalize(stmt_); }

    Stmt(const Stmt&) = delete;
    Stmt& operator=(const Stmt&) = delete;

    Stmt& bind(const std::string& v);
    Stmt& bind(const char* v) { return bind(std::string(v)); }
    Stmt& bind(const std::optional<std::string>& v);
    Stmt& bind(int64_t v);
    Stmt& bind(int v) { return bind(static_cast<int64_t>(v)); }
    Stmt& bind(uint32_t v) { return bind(static_cast<int64_t>(v)); }
    Stmt& bind_null();

    // Returns true while a row is available; throws on error.
    bool step();

    // Step a statement that must finish without rows.
    void run() { while (step()) {} }

    // Rows touched / rowid assigned by the last completed write
    int changes() const { return sqlite3_changes(db_); }
    int64_t last_insert_id() const { return sqlite3_last_insert_rowid(db_); }

    int64_t column_int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    int column_int(int col) const { return sqlite3_column_int(stmt_, col); }
    double column_double(int col) const { return sqlite3_column_double(stmt_, col); }
    std::string column_text(int col) const;
    std::optional<std::string> column_optional_text(int col) const;
    bool column_is_null(int col) const {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }
    bool column_is_text(int col) const {
        return sqlite3_column_type(stmt_, col) == SQLITE_TEXT;
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;
    int next_index_ = 1;
};

// Scoped BEGIN IMMEDIATE ... COMMIT; rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3* db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    sqlite3* db_;
    bool done_ = false;
};

// Treat empty strings as SQL NULL
inline std::optional<std::string> nullable(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

} // namespace hoofy

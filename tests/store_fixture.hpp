#pragma once
#include "memory/sqlite_store.hpp"
#include "memory/errors.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <unistd.h>

// 2023-11-14 22:13:20 UTC
constexpr uint64_t kFixedNow = 1700000000;

inline std::string next_store_dir() {
    static int counter = 0;
    return "/tmp/hoofy_test_store_" + std::to_string(getpid()) + "_" + std::to_string(counter++);
}

inline hoofy::MemoryConfig test_config(const std::string& dir) {
    hoofy::MemoryConfig cfg;
    cfg.data_dir = dir;
    return cfg;
}

// Removes the directory on both ends of its lifetime
struct TempDir {
    std::string path;
    explicit TempDir(std::string p) : path(std::move(p)) { std::filesystem::remove_all(path); }
    ~TempDir() { std::filesystem::remove_all(path); }
};

// Fresh store on a per-test directory with a pinned clock and one session
// "s1" in project "hoofy". Declared first, tmp outlives the store.
struct StoreFixture {
    TempDir tmp{next_store_dir()};
    uint64_t now = kFixedNow;
    hoofy::SqliteStore store{test_config(tmp.path), [this] { return now; }};

    StoreFixture() { store.create_session("s1", "hoofy", "/work/hoofy"); }

    void advance_minutes(int minutes) { now += static_cast<uint64_t>(minutes) * 60; }

    int64_t add(const std::string& title, const std::string& content,
                const std::string& type = "decision", const std::string& topic_key = "") {
        hoofy::AddObservationParams p;
        p.session_id = "s1";
        p.type = type;
        p.title = title;
        p.content = content;
        p.project = "hoofy";
        p.topic_key = topic_key;
        return store.add_observation(p);
    }

    // Second connection for inspecting or corrupting raw rows
    int64_t raw_int(const std::string& sql) {
        sqlite3* db = nullptr;
        if (sqlite3_open(store.path().c_str(), &db) != SQLITE_OK) {
            sqlite3_close(db);
            throw std::runtime_error("raw_int: cannot open " + store.path());
        }
        sqlite3_stmt* stmt = nullptr;
        int64_t value = -1;
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK &&
            sqlite3_step(stmt) == SQLITE_ROW) {
            value = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
        sqlite3_close(db);
        return value;
    }

    void raw_exec(const std::string& sql) {
        sqlite3* db = nullptr;
        if (sqlite3_open(store.path().c_str(), &db) != SQLITE_OK) {
            sqlite3_close(db);
            throw std::runtime_error("raw_exec: cannot open " + store.path());
        }
        // Writes fire the FTS triggers
        std::string script = "PRAGMA trusted_schema=ON; " + sql;
        char* err = nullptr;
        int rc = sqlite3_exec(db, script.c_str(), nullptr, nullptr, &err);
        std::string msg = err ? err : "";
        sqlite3_free(err);
        sqlite3_close(db);
        if (rc != SQLITE_OK) throw std::runtime_error("raw_exec: " + msg);
    }
};

// Kind of the MemoryError thrown by fn, or nullopt if nothing was thrown
template <typename F>
std::optional<hoofy::ErrorKind> error_kind_of(F&& fn) {
    try {
        fn();
    } catch (const hoofy::MemoryError& e) {
        return e.kind();
    }
    return std::nullopt;
}

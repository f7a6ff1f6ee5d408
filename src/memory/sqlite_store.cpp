#include "sqlite_store.hpp"
#include "sqlite_util.hpp"
#include "store_rows.hpp"
#include "text.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <iostream>

namespace hoofy {

static const char* kSchema =
    "CREATE TABLE IF NOT EXISTS sessions ("
    "  id         TEXT PRIMARY KEY,"
    "  project    TEXT NOT NULL,"
    "  directory  TEXT NOT NULL,"
    "  started_at TEXT NOT NULL DEFAULT (datetime('now')),"
    "  ended_at   TEXT,"
    "  summary    TEXT"
    ");"

    "CREATE TABLE IF NOT EXISTS observations ("
    "  id              INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  session_id      TEXT    NOT NULL,"
    "  type            TEXT    NOT NULL,"
    "  title           TEXT    NOT NULL,"
    "  content         TEXT    NOT NULL,"
    "  tool_name       TEXT,"
    "  project         TEXT,"
    "  scope           TEXT    NOT NULL DEFAULT 'project',"
    "  topic_key       TEXT,"
    "  normalized_hash TEXT,"
    "  revision_count  INTEGER NOT NULL DEFAULT 1,"
    "  duplicate_count INTEGER NOT NULL DEFAULT 1,"
    "  last_seen_at    TEXT,"
    "  created_at      TEXT    NOT NULL DEFAULT (datetime('now')),"
    "  updated_at      TEXT    NOT NULL DEFAULT (datetime('now')),"
    "  deleted_at      TEXT,"
    "  FOREIGN KEY (session_id) REFERENCES sessions(id)"
    ");"

    "CREATE INDEX IF NOT EXISTS idx_obs_session ON observations(session_id);"
    "CREATE INDEX IF NOT EXISTS idx_obs_type    ON observations(type);"
    "CREATE INDEX IF NOT EXISTS idx_obs_project ON observations(project);"
    "CREATE INDEX IF NOT EXISTS idx_obs_created ON observations(created_at DESC);"
    "CREATE INDEX IF NOT EXISTS idx_obs_scope   ON observations(scope);"
    "CREATE INDEX IF NOT EXISTS idx_obs_topic   ON observations(topic_key, project, scope, updated_at DESC);"
    "CREATE INDEX IF NOT EXISTS idx_obs_deleted ON observations(deleted_at);"
    "CREATE INDEX IF NOT EXISTS idx_obs_dedupe  ON observations("
    "  normalized_hash, project, scope, type, title, created_at DESC);"

    "CREATE VIRTUAL TABLE IF NOT EXISTS observations_fts USING fts5("
    "  title, content, tool_name, type, project,"
    "  content='observations', content_rowid='id'"
    ");"

    "CREATE TABLE IF NOT EXISTS user_prompts ("
    "  id         INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  session_id TEXT    NOT NULL,"
    "  content    TEXT    NOT NULL,"
    "  project    TEXT,"
    "  created_at TEXT    NOT NULL DEFAULT (datetime('now')),"
    "  FOREIGN KEY (session_id) REFERENCES sessions(id)"
    ");"

    "CREATE INDEX IF NOT EXISTS idx_prompts_session ON user_prompts(session_id);"
    "CREATE INDEX IF NOT EXISTS idx_prompts_project ON user_prompts(project);"
    "CREATE INDEX IF NOT EXISTS idx_prompts_created ON user_prompts(created_at DESC);"

    "CREATE VIRTUAL TABLE IF NOT EXISTS prompts_fts USING fts5("
    "  content, project,"
    "  content='user_prompts', content_rowid='id'"
    ");"

    // Relations: typed edges between observations, removed with either end
    "CREATE TABLE IF NOT EXISTS relations ("
    "  id         INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  from_id    INTEGER NOT NULL,"
    "  to_id      INTEGER NOT NULL,"
    "  type       TEXT    NOT NULL DEFAULT 'relates_to',"
    "  note       TEXT,"
    "  created_at TEXT    NOT NULL DEFAULT (datetime('now')),"
    "  FOREIGN KEY (from_id) REFERENCES observations(id) ON DELETE CASCADE,"
    "  FOREIGN KEY (to_id)   REFERENCES observations(id) ON DELETE CASCADE"
    ");"

    "CREATE INDEX IF NOT EXISTS idx_rel_from ON relations(from_id);"
    "CREATE INDEX IF NOT EXISTS idx_rel_to   ON relations(to_id);"
    "CREATE INDEX IF NOT EXISTS idx_rel_type ON relations(type);"
    "CREATE UNIQUE INDEX IF NOT EXISTS idx_rel_unique ON relations(from_id, to_id, type);";

static const char* kObservationTriggers =
    "CREATE TRIGGER obs_fts_insert AFTER INSERT ON observations BEGIN"
    "  INSERT INTO observations_fts(rowid, title, content, tool_name, type, project)"
    "  VALUES (new.id, new.title, new.content, new.tool_name, new.type, new.project);"
    "END;"

    "CREATE TRIGGER obs_fts_delete AFTER DELETE ON observations BEGIN"
    "  INSERT INTO observations_fts(observations_fts, rowid, title, content, tool_name, type, project)"
    "  VALUES ('delete', old.id, old.title, old.content, old.tool_name, old.type, old.project);"
    "END;"

    "CREATE TRIGGER obs_fts_update AFTER UPDATE ON observations BEGIN"
    "  INSERT INTO observations_fts(observations_fts, rowid, title, content, tool_name, type, project)"
    "  VALUES ('delete', old.id, old.title, old.content, old.tool_name, old.type, old.project);"
    "  INSERT INTO observations_fts(rowid, title, content, tool_name, type, project)"
    "  VALUES (new.id, new.title, new.content, new.tool_name, new.type, new.project);"
    "END;";

static const char* kPromptTriggers =
    "CREATE TRIGGER prompt_fts_insert AFTER INSERT ON user_prompts BEGIN"
    "  INSERT INTO prompts_fts(rowid, content, project)"
    "  VALUES (new.id, new.content, new.project);"
    "END;"

    "CREATE TRIGGER prompt_fts_delete AFTER DELETE ON user_prompts BEGIN"
    "  INSERT INTO prompts_fts(prompts_fts, rowid, content, project)"
    "  VALUES ('delete', old.id, old.content, old.project);"
    "END;"

    "CREATE TRIGGER prompt_fts_update AFTER UPDATE ON user_prompts BEGIN"
    "  INSERT INTO prompts_fts(prompts_fts, rowid, content, project)"
    "  VALUES ('delete', old.id, old.content, old.project);"
    "  INSERT INTO prompts_fts(rowid, content, project)"
    "  VALUES (new.id, new.content, new.project);"
    "END;";

// Legacy rows written before these columns had defaults
static const char* kLegacyRepairs[] = {
    "UPDATE observations SET scope = 'project' WHERE scope IS NULL OR scope = '';",
    "UPDATE observations SET topic_key = NULL WHERE topic_key = '';",
    "UPDATE observations SET revision_count = 1 WHERE revision_count IS NULL OR revision_count < 1;",
    "UPDATE observations SET duplicate_count = 1 WHERE duplicate_count IS NULL OR duplicate_count < 1;",
    "UPDATE observations SET updated_at = created_at WHERE updated_at IS NULL OR updated_at = '';",
    "UPDATE user_prompts SET project = '' WHERE project IS NULL;",
};

SqliteStore::SqliteStore(const MemoryConfig& config, Clock clock)
    : config_(config), clock_(std::move(clock)), path_(config.db_path()) {
    if (!clock_) clock_ = epoch_seconds;

    open_database();
    try {
        init_schema();
    } catch (const MemoryError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteStore::open_database() {
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw MemoryError(ErrorKind::Internal,
                              "SqliteStore: cannot create " + parent.string() + ": " + ec.message());
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw MemoryError(ErrorKind::Internal, "SqliteStore: failed to open database: " + err);
    }
    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, static_cast<int>(config_.busy_timeout_ms));
}

void SqliteStore::init_schema() {
    exec_sql(db_, "PRAGMA journal_mode=WAL;", "enable WAL");
    exec_sql(db_, "PRAGMA synchronous=NORMAL;", "set synchronous");
    exec_sql(db_, "PRAGMA foreign_keys=ON;", "enable foreign keys");
    // Allow FTS5 virtual table use inside triggers (required since SQLite 3.37)
    exec_sql(db_, "PRAGMA trusted_schema=ON;", "set trusted_schema");

    exec_sql(db_, kSchema, "create schema");
    repair_legacy_rows();
    create_triggers("obs_fts_insert", kObservationTriggers);
    create_triggers("prompt_fts_insert", kPromptTriggers);
}

void SqliteStore::repair_legacy_rows() {
    for (const char* sql : kLegacyRepairs) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::cerr << "[memory] Legacy row repair failed: "
                      << (err ? err : "unknown error") << "\n";
        }
        sqlite3_free(err);
    }
}

void SqliteStore::create_triggers(const char* probe_name, const char* sql) {
    bool present;
    {
        Stmt probe(db_, "SELECT name FROM sqlite_master WHERE type = 'trigger' AND name = ?");
        probe.bind(probe_name);
        present = probe.step();
    }
    if (!present) {
        exec_sql(db_, sql, std::string("create triggers ") + probe_name);
    }
}

std::string SqliteStore::now_text() const {
    return format_sqlite_time(clock_());
}

// ── Sessions ─────────────────────────────────────────────────────

void SqliteStore::create_session(const std::string& id, const std::string& project,
                                 const std::string& directory) {
    if (id.empty()) {
        throw MemoryError(ErrorKind::InvalidArgument, "create_session: id is required");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    create_session_locked(id, project, directory);
}

void SqliteStore::create_session_locked(const std::string& id, const std::string& project,
                                        const std::string& directory) {
    Stmt st(db_, "INSERT OR IGNORE INTO sessions (id, project, directory, started_at) "
                 "VALUES (?, ?, ?, ?)");
    st.bind(id).bind(project).bind(directory).bind(now_text()).run();
}

void SqliteStore::end_session(const std::string& id, const std::string& summary) {
    std::lock_guard<std::mutex> lock(mutex_);
    Stmt st(db_, "UPDATE sessions SET ended_at = ?, summary = ? WHERE id = ?");
    st.bind(now_text()).bind(nullable(summary)).bind(id).run();
    if (st.changes() == 0) {
        throw MemoryError(ErrorKind::NotFound, "session not found: " + id);
    }
}

std::optional<Session> SqliteStore::get_session(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_session_locked(id);
}

std::optional<Session> SqliteStore::get_session_locked(const std::string& id) {
    Stmt st(db_, std::string("SELECT ") + kSessionColumns + " FROM sessions WHERE id = ?");
    st.bind(id);
    if (!st.step()) return std::nullopt;
    auto session = session_from_row(st);
    if (!session) {
        std::cerr << "[memory] Session " << id << " is unreadable\n";
    }
    return session;
}

std::vector<SessionSummary> SqliteStore::recent_sessions(const std::string& project,
                                                         uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    return recent_sessions_locked(project, limit);
}

std::vector<SessionSummary> SqliteStore::recent_sessions_locked(const std::string& project,
                                                                uint32_t limit) {
    if (limit == 0) limit = 5;

    std::string sql =
        "SELECT s.id, s.project, s.started_at, s.ended_at, s.summary, COUNT(o.id) "
        "FROM sessions s "
        "LEFT JOIN observations o ON o.session_id = s.id AND o.deleted_at IS NULL "
        "WHERE 1=1";
    if (!project.empty()) sql += " AND s.project = ?";
    sql += " GROUP BY s.id"
           " ORDER BY MAX(COALESCE(o.created_at, s.started_at)) DESC, s.rowid DESC"
           " LIMIT ?";

    Stmt st(db_, sql);
    if (!project.empty()) st.bind(project);
    st.bind(limit);

    std::vector<SessionSummary> results;
    while (st.step()) {
        if (!st.column_is_text(0) || !st.column_is_text(1) || !st.column_is_text(2)) {
            std::cerr << "[memory] Skipping unreadable session row in recent sessions\n";
            continue;
        }
        SessionSummary s;
        s.id = st.column_text(0);
        s.project = st.column_text(1);
        s.started_at = st.column_text(2);
        s.ended_at = st.column_optional_text(3);
        s.summary = st.column_optional_text(4);
        s.observation_count = static_cast<uint32_t>(st.column_int64(5));
        results.push_back(std::move(s));
    }
    return results;
}

// ── Observations ─────────────────────────────────────────────────

int64_t SqliteStore::add_observation(const AddObservationParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    return add_observation_locked(params);
}

int64_t SqliteStore::add_observation_locked(const AddObservationParams& p) {
    if (p.session_id.empty()) {
        throw MemoryError(ErrorKind::InvalidArgument, "add_observation: session_id is required");
    }
    if (trim(p.title).empty() || trim(p.content).empty()) {
        throw MemoryError(ErrorKind::InvalidArgument,
                          "add_observation: title and content are required");
    }

    std::string title = strip_private_tags(p.title);
    std::string content = cap_content(strip_private_tags(p.content),
                                      config_.max_observation_length);
    std::string scope = scope_to_string(scope_from_string(p.scope));
    std::string hash = hash_normalized(content);
    std::string topic_key = normalize_topic_key(p.topic_key);
    std::optional<std::string> project = nullable(p.project);
    uint64_t now_epoch = clock_();
    std::string now = format_sqlite_time(now_epoch);

    // Topic upsert: one living row per (topic_key, project, scope)
    if (!topic_key.empty()) {
        std::optional<int64_t> existing;
        {
            Stmt find(db_,
                "SELECT id FROM observations"
                " WHERE topic_key = ?"
                "   AND ifnull(project, '') = ifnull(?, '')"
                "   AND scope = ?"
                "   AND deleted_at IS NULL"
                " ORDER BY datetime(updated_at) DESC, datetime(created_at) DESC, id DESC"
                " LIMIT 1");
            find.bind(topic_key).bind(project).bind(scope);
            if (find.step()) existing = find.column_int64(0);
        }
        if (existing) {
            Stmt upd(db_,
                "UPDATE observations"
                " SET type = ?, title = ?, content = ?, tool_name = ?, topic_key = ?,"
                "     normalized_hash = ?, revision_count = revision_count + 1,"
                "     last_seen_at = ?, updated_at = ?"
                " WHERE id = ?");
            upd.bind(p.type).bind(title).bind(content).bind(nullable(p.tool_name))
               .bind(topic_key).bind(hash).bind(now).bind(now).bind(*existing).run();
            return *existing;
        }
    }

    // Content dedup inside the window
    int64_t window_minutes = config_.dedupe_window_minutes > 0 ? config_.dedupe_window_minutes : 15;
    uint64_t window = static_cast<uint64_t>(window_minutes) * 60;
    std::string cutoff = format_sqlite_time(now_epoch > window ? now_epoch - window : 0);

    std::optional<int64_t> duplicate;
    {
        Stmt find(db_,
            "SELECT id FROM observations"
            " WHERE normalized_hash = ?"
            "   AND ifnull(project, '') = ifnull(?, '')"
            "   AND scope = ?"
            "   AND type = ?"
            "   AND title = ?"
            "   AND deleted_at IS NULL"
            "   AND datetime(created_at) >= ?"
            " ORDER BY created_at DESC, id DESC"
            " LIMIT 1");
        find.bind(hash).bind(project).bind(scope).bind(p.type).bind(title).bind(cutoff);
        if (find.step()) duplicate = find.column_int64(0);
    }
    if (duplicate) {
        Stmt upd(db_,
            "UPDATE observations"
            " SET duplicate_count = duplicate_count + 1, last_seen_at = ?, updated_at = ?"
            " WHERE id = ?");
        upd.bind(now).bind(now).bind(*duplicate).run();
        return *duplicate;
    }

    Stmt ins(db_,
        "INSERT INTO observations (session_id, type, title, content, tool_name, project, scope,"
        " topic_key, normalized_hash, revision_count, duplicate_count, last_seen_at,"
        " created_at, updated_at)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, 1, 1, ?, ?, ?)");
    ins.bind(p.session_id).bind(p.type).bind(title).bind(content).bind(nullable(p.tool_name))
       .bind(project).bind(scope).bind(nullable(topic_key)).bind(hash)
       .bind(now).bind(now).bind(now);
    try {
        ins.run();
    } catch (const MemoryError& e) {
        if (e.kind() == ErrorKind::NotFound) {
            throw MemoryError(ErrorKind::NotFound, "session not found: " + p.session_id);
        }
        throw;
    }
    return ins.last_insert_id();
}

std::optional<Observation> SqliteStore::find_active_locked(int64_t id) {
    Stmt st(db_, std::string("SELECT ") + kObservationColumns +
                 " FROM observations WHERE id = ? AND deleted_at IS NULL");
    st.bind(id);
    if (!st.step()) return std::nullopt;
    auto obs = observation_from_row(st);
    if (!obs) {
        throw MemoryError(ErrorKind::Internal,
                          "observation #" + std::to_string(id) + " is unreadable");
    }
    return obs;
}

Observation SqliteStore::get_observation_locked(int64_t id) {
    auto obs = find_active_locked(id);
    if (!obs) {
        throw MemoryError(ErrorKind::NotFound,
                          "observation #" + std::to_string(id) + " not found");
    }
    return *obs;
}

Observation SqliteStore::get_observation(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_observation_locked(id);
}

Observation SqliteStore::update_observation(int64_t id, const UpdateObservationParams& p) {
    std::lock_guard<std::mutex> lock(mutex_);
    Observation obs = get_observation_locked(id);

    std::string type = p.type.value_or(obs.type);
    std::string title = p.title ? strip_private_tags(*p.title) : obs.title;
    std::string content = obs.content;
    if (p.content) {
        content = cap_content(strip_private_tags(*p.content), config_.max_observation_length);
    }
    std::string project = p.project.value_or(obs.project.value_or(""));
    std::string scope = scope_to_string(p.scope ? scope_from_string(*p.scope) : obs.scope);
    std::string topic_key = p.topic_key ? normalize_topic_key(*p.topic_key)
                                        : obs.topic_key.value_or("");

    Stmt st(db_,
        "UPDATE observations"
        " SET type = ?, title = ?, content = ?, project = ?, scope = ?, topic_key = ?,"
        "     normalized_hash = ?, revision_count = revision_count + 1, updated_at = ?"
        " WHERE id = ? AND deleted_at IS NULL");
    st.bind(type).bind(title).bind(content).bind(nullable(project)).bind(scope)
      .bind(nullable(topic_key)).bind(hash_normalized(content)).bind(now_text()).bind(id).run();

    return get_observation_locked(id);
}

void SqliteStore::delete_observation(int64_t id, bool hard) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (hard) {
        // Relations go with it (ON DELETE CASCADE)
        Stmt st(db_, "DELETE FROM observations WHERE id = ?");
        st.bind(id).run();
        if (st.changes() == 0) {
            throw MemoryError(ErrorKind::NotFound,
                              "observation #" + std::to_string(id) + " not found");
        }
        return;
    }

    std::string now = now_text();
    Stmt st(db_, "UPDATE observations SET deleted_at = ?, updated_at = ?"
                 " WHERE id = ? AND deleted_at IS NULL");
    st.bind(now).bind(now).bind(id).run();
    if (st.changes() == 0) {
        throw MemoryError(ErrorKind::NotFound,
                          "observation #" + std::to_string(id) + " not found or already deleted");
    }
}

std::optional<Observation> SqliteStore::find_by_topic_key(const std::string& topic_key,
                                                          const std::string& project,
                                                          Scope scope) {
    std::string key = normalize_topic_key(topic_key);
    if (key.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lock(mutex_);
    Stmt st(db_, std::string("SELECT ") + kObservationColumns +
                 " FROM observations"
                 " WHERE topic_key = ?"
                 "   AND ifnull(project, '') = ifnull(?, '')"
                 "   AND scope = ?"
                 "   AND deleted_at IS NULL"
                 " ORDER BY datetime(updated_at) DESC, datetime(created_at) DESC, id DESC"
                 " LIMIT 1");
    st.bind(key).bind(nullable(project)).bind(scope_to_string(scope));
    auto found = collect_observations(st, "topic key lookup");
    if (found.empty()) return std::nullopt;
    return found.front();
}

std::vector<Observation> SqliteStore::recent_observations(const std::string& project,
                                                          std::optional<Scope> scope,
                                                          uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    return recent_observations_locked(project, scope, limit);
}

std::vector<Observation> SqliteStore::recent_observations_locked(const std::string& project,
                                                                 std::optional<Scope> scope,
                                                                 uint32_t limit) {
    if (limit == 0) limit = config_.max_context_results;

    std::string sql = std::string("SELECT ") + kObservationColumns +
                      " FROM observations WHERE deleted_at IS NULL";
    if (!project.empty()) sql += " AND project = ?";
    if (scope) sql += " AND scope = ?";
    sql += " ORDER BY created_at DESC, id DESC LIMIT ?";

    Stmt st(db_, sql);
    if (!project.empty()) st.bind(project);
    if (scope) st.bind(scope_to_string(*scope));
    st.bind(limit);
    return collect_observations(st, "recent observations");
}

uint32_t SqliteStore::count_observations(const std::string& project,
                                         std::optional<Scope> scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_observations_locked(project, scope);
}

uint32_t SqliteStore::count_observations_locked(const std::string& project,
                                                std::optional<Scope> scope) {
    std::string sql = "SELECT COUNT(*) FROM observations WHERE deleted_at IS NULL";
    if (!project.empty()) sql += " AND project = ?";
    if (scope) sql += " AND scope = ?";

    Stmt st(db_, sql);
    if (!project.empty()) st.bind(project);
    if (scope) st.bind(scope_to_string(*scope));
    return st.step() ? static_cast<uint32_t>(st.column_int64(0)) : 0;
}

std::vector<Observation> SqliteStore::find_stale_observations(const std::string& project,
                                                              std::optional<Scope> scope,
                                                              int older_than_days,
                                                              uint32_t limit) {
    if (older_than_days <= 0) {
        throw MemoryError(ErrorKind::InvalidArgument,
                          "find_stale_observations: older_than_days must be > 0");
    }
    if (limit == 0) limit = 200;

    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t now = clock_();
    uint64_t age = static_cast<uint64_t>(older_than_days) * 86400;
    std::string cutoff = format_sqlite_time(now > age ? now - age : 0);

    std::string sql = std::string("SELECT ") + kObservationColumns +
                      " FROM observations WHERE deleted_at IS NULL AND datetime(created_at) < ?";
    if (!project.empty()) sql += " AND project = ?";
    if (scope) sql += " AND scope = ?";
    sql += " ORDER BY created_at ASC, id ASC LIMIT ?";

    Stmt st(db_, sql);
    st.bind(cutoff);
    if (!project.empty()) st.bind(project);
    if (scope) st.bind(scope_to_string(*scope));
    st.bind(limit);
    return collect_observations(st, "stale observations");
}

CompactResult SqliteStore::compact_observations(const CompactParams& params) {
    if (params.ids.empty()) {
        throw MemoryError(ErrorKind::InvalidArgument, "compact: ids must not be empty");
    }
    if (params.summary_title.empty() && !params.summary_content.empty()) {
        throw MemoryError(ErrorKind::InvalidArgument,
                          "compact: summary_content requires summary_title");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<Scope> scope;
    if (!params.scope.empty()) scope = scope_from_string(params.scope);

    CompactResult result;
    result.total_before = count_observations_locked(params.project, scope);

    Transaction tx(db_);
    std::string now = now_text();
    for (int64_t id : params.ids) {
        Stmt st(db_, "UPDATE observations SET deleted_at = ?, updated_at = ?"
                     " WHERE id = ? AND deleted_at IS NULL");
        st.bind(now).bind(now).bind(id).run();
        result.deleted_count += static_cast<uint32_t>(st.changes());
    }

    if (!params.summary_title.empty()) {
        std::string session_id = params.session_id.empty() ? "manual-save" : params.session_id;
        create_session_locked(session_id, params.project, "");

        AddObservationParams summary;
        summary.session_id = session_id;
        summary.type = "compaction_summary";
        summary.title = params.summary_title;
        summary.content = params.summary_content.empty() ? params.summary_title
                                                         : params.summary_content;
        summary.project = params.project;
        summary.scope = params.scope;
        result.summary_id = add_observation_locked(summary);
    }
    tx.commit();

    result.total_after = count_observations_locked(params.project, scope);
    return result;
}

// ── Prompts ──────────────────────────────────────────────────────

int64_t SqliteStore::add_prompt(const AddPromptParams& params) {
    if (params.session_id.empty() || trim(params.content).empty()) {
        throw MemoryError(ErrorKind::InvalidArgument,
                          "add_prompt: session_id and content are required");
    }
    std::string content = cap_content(strip_private_tags(params.content),
                                      config_.max_observation_length);

    std::lock_guard<std::mutex> lock(mutex_);
    Stmt st(db_, "INSERT INTO user_prompts (session_id, content, project, created_at)"
                 " VALUES (?, ?, ?, ?)");
    st.bind(params.session_id).bind(content).bind(params.project).bind(now_text());
    try {
        st.run();
    } catch (const MemoryError& e) {
        if (e.kind() == ErrorKind::NotFound) {
            throw MemoryError(ErrorKind::NotFound, "session not found: " + params.session_id);
        }
        throw;
    }
    return st.last_insert_id();
}

std::vector<Prompt> SqliteStore::recent_prompts(const std::string& project, uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    return recent_prompts_locked(project, limit);
}

std::vector<Prompt> SqliteStore::recent_prompts_locked(const std::string& project,
                                                       uint32_t limit) {
    if (limit == 0) limit = 20;

    std::string sql = std::string("SELECT ") + kPromptColumns + " FROM user_prompts";
    if (!project.empty()) sql += " WHERE project = ?";
    sql += " ORDER BY created_at DESC, id DESC LIMIT ?";

    Stmt st(db_, sql);
    if (!project.empty()) st.bind(project);
    st.bind(limit);
    return collect_prompts(st, "recent prompts");
}

} // namespace hoofy

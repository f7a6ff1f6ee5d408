#pragma once
#include "../memory.hpp"
#include "../config.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace hoofy {

// Persistent memory engine over one SQLite database file. Every public
// method is synchronous and serialized by an internal mutex; failures are
// thrown as MemoryError.
class SqliteStore {
public:
    // Opens (creating if needed) <data_dir>/memory.db and bootstraps the
    // schema. A null clock means the wall clock.
    explicit SqliteStore(const MemoryConfig& config, Clock clock = nullptr);
    ~SqliteStore();

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    const MemoryConfig& config() const { return config_; }
    const std::string& path() const { return path_; }

    // ── Sessions ─────────────────────────────────────────────────
    // Duplicate ids are ignored; the original row is kept.
    void create_session(const std::string& id, const std::string& project,
                        const std::string& directory);
    void end_session(const std::string& id, const std::string& summary);
    std::optional<Session> get_session(const std::string& id);
    std::vector<SessionSummary> recent_sessions(const std::string& project = "",
                                                uint32_t limit = 0);

    // ── Observations ─────────────────────────────────────────────
    // Topic upsert, then content dedup, then plain insert. Returns the id
    // of the row that was written.
    int64_t add_observation(const AddObservationParams& params);
    Observation get_observation(int64_t id);
    Observation update_observation(int64_t id, const UpdateObservationParams& params);
    void delete_observation(int64_t id, bool hard = false);
    std::optional<Observation> find_by_topic_key(const std::string& topic_key,
                                                 const std::string& project,
                                                 Scope scope);
    std::vector<Observation> recent_observations(const std::string& project = "",
                                                 std::optional<Scope> scope = std::nullopt,
                                                 uint32_t limit = 0);
    uint32_t count_observations(const std::string& project = "",
                                std::optional<Scope> scope = std::nullopt);
    std::vector<Observation> find_stale_observations(const std::string& project,
                                                     std::optional<Scope> scope,
                                                     int older_than_days,
                                                     uint32_t limit = 0);
    CompactResult compact_observations(const CompactParams& params);

    // ── Relations ────────────────────────────────────────────────
    std::vector<int64_t> add_relation(const AddRelationParams& params);
    void remove_relation(int64_t id);
    std::vector<Relation> get_relations(int64_t observation_id);
    ContextResult build_context(int64_t observation_id, int max_depth = 2);

    // ── Prompts ──────────────────────────────────────────────────
    int64_t add_prompt(const AddPromptParams& params);
    std::vector<Prompt> recent_prompts(const std::string& project = "", uint32_t limit = 0);

    // ── Search / Timeline ────────────────────────────────────────
    std::vector<SearchResult> search(const std::string& query, const SearchOptions& opts = {});
    std::vector<Prompt> search_prompts(const std::string& query,
                                       const std::string& project = "",
                                       uint32_t limit = 0);
    TimelineResult timeline(int64_t observation_id, int before = 5, int after = 5);

    // ── Passive capture ──────────────────────────────────────────
    PassiveCaptureResult passive_capture(const PassiveCaptureParams& params);

    // ── Stats / formatting ───────────────────────────────────────
    Stats stats();
    std::string format_context(const std::string& project = "",
                               std::optional<Scope> scope = std::nullopt);

    // ── Export / Import ──────────────────────────────────────────
    ExportData export_data();
    std::string export_json();
    ImportResult import_data(const ExportData& data);
    ImportResult import_json(const std::string& text);

private:
    void open_database();
    void init_schema();
    void repair_legacy_rows();
    void create_triggers(const char* probe_name, const char* sql);

    std::string now_text() const;

    // Callers hold mutex_
    void create_session_locked(const std::string& id, const std::string& project,
                               const std::string& directory);
    std::optional<Session> get_session_locked(const std::string& id);
    std::vector<SessionSummary> recent_sessions_locked(const std::string& project,
                                                       uint32_t limit);
    int64_t add_observation_locked(const AddObservationParams& params);
    std::optional<Observation> find_active_locked(int64_t id);
    Observation get_observation_locked(int64_t id);
    std::vector<Observation> recent_observations_locked(const std::string& project,
                                                        std::optional<Scope> scope,
                                                        uint32_t limit);
    uint32_t count_observations_locked(const std::string& project,
                                       std::optional<Scope> scope);
    std::vector<Relation> get_relations_locked(int64_t observation_id);
    std::vector<Prompt> recent_prompts_locked(const std::string& project, uint32_t limit);

    MemoryConfig config_;
    Clock clock_;
    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace hoofy

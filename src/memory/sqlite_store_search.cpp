#include "sqlite_store.hpp"
#include "sqlite_util.hpp"
#include "store_rows.hpp"
#include "text.hpp"
#include "../util.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace hoofy {

namespace {

constexpr uint32_t kDefaultSearchLimit = 10;

// Filters shared by the ranked query and the recency fallback. `prefix`
// qualifies column names ("o." when joined with the FTS table).
std::string observation_filters(const SearchOptions& opts, const std::string& prefix) {
    std::string sql;
    if (!opts.type.empty()) sql += " AND " + prefix + "type = ?";
    if (!opts.project.empty()) sql += " AND " + prefix + "project = ?";
    if (opts.scope) sql += " AND " + prefix + "scope = ?";
    return sql;
}

void bind_filters(Stmt& st, const SearchOptions& opts) {
    if (!opts.type.empty()) st.bind(opts.type);
    if (!opts.project.empty()) st.bind(opts.project);
    if (opts.scope) st.bind(scope_to_string(*opts.scope));
}

std::string qualified_observation_columns() {
    std::string out;
    std::istringstream ss(kObservationColumns);
    std::string col;
    while (std::getline(ss, col, ',')) {
        if (!out.empty()) out += ", ";
        out += "o." + trim(col);
    }
    return out;
}

} // namespace

std::vector<SearchResult> SqliteStore::search(const std::string& query,
                                              const SearchOptions& opts) {
    uint32_t limit = opts.limit == 0 ? kDefaultSearchLimit : opts.limit;
    limit = std::min(limit, config_.max_search_results);

    std::string fts_query = sanitize_fts(query);

    std::string sql;
    if (fts_query.empty()) {
        // Recency listing, no index involved
        sql = std::string("SELECT ") + kObservationColumns + ", 0 AS rank"
              " FROM observations WHERE deleted_at IS NULL" +
              observation_filters(opts, "") +
              " ORDER BY created_at DESC, id DESC LIMIT ?";
    } else {
        sql = "SELECT " + qualified_observation_columns() + ", fts.rank"
              " FROM observations_fts fts"
              " JOIN observations o ON o.id = fts.rowid"
              " WHERE observations_fts MATCH ? AND o.deleted_at IS NULL" +
              observation_filters(opts, "o.") +
              " ORDER BY fts.rank LIMIT ?";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Stmt st(db_, sql);
    if (!fts_query.empty()) st.bind(fts_query);
    bind_filters(st, opts);
    st.bind(limit);

    std::vector<SearchResult> results;
    while (st.step()) {
        auto obs = observation_from_row(st);
        if (!obs) {
            std::cerr << "[memory] Skipping unreadable observation #" << st.column_int64(0)
                      << " in search\n";
            continue;
        }
        results.push_back({std::move(*obs), st.column_double(15)});
    }
    return results;
}

std::vector<Prompt> SqliteStore::search_prompts(const std::string& query,
                                                const std::string& project,
                                                uint32_t limit) {
    if (limit == 0) limit = kDefaultSearchLimit;
    limit = std::min(limit, config_.max_search_results);

    std::string fts_query = sanitize_fts(query);

    std::lock_guard<std::mutex> lock(mutex_);
    if (fts_query.empty()) {
        return recent_prompts_locked(project, limit);
    }

    std::string sql =
        "SELECT p.id, p.session_id, p.content, ifnull(p.project, ''), p.created_at"
        " FROM prompts_fts fts"
        " JOIN user_prompts p ON p.id = fts.rowid"
        " WHERE prompts_fts MATCH ?";
    if (!project.empty()) sql += " AND p.project = ?";
    sql += " ORDER BY fts.rank LIMIT ?";

    Stmt st(db_, sql);
    st.bind(fts_query);
    if (!project.empty()) st.bind(project);
    st.bind(limit);
    return collect_prompts(st, "prompt search");
}

TimelineResult SqliteStore::timeline(int64_t observation_id, int before, int after) {
    if (before <= 0) before = 5;
    if (after <= 0) after = 5;

    std::lock_guard<std::mutex> lock(mutex_);
    TimelineResult result;
    result.focus = get_observation_locked(observation_id);
    const std::string& session_id = result.focus.session_id;

    // Best-effort: manual saves may point at a session that was never recorded
    result.session = get_session_locked(session_id);

    {
        Stmt st(db_, std::string("SELECT ") + kObservationColumns +
                     " FROM observations"
                     " WHERE session_id = ? AND id < ? AND deleted_at IS NULL"
                     " ORDER BY id DESC LIMIT ?");
        st.bind(session_id).bind(observation_id).bind(before);
        result.before = collect_observations(st, "timeline");
        std::reverse(result.before.begin(), result.before.end());
    }
    {
        Stmt st(db_, std::string("SELECT ") + kObservationColumns +
                     " FROM observations"
                     " WHERE session_id = ? AND id > ? AND deleted_at IS NULL"
                     " ORDER BY id ASC LIMIT ?");
        st.bind(session_id).bind(observation_id).bind(after);
        result.after = collect_observations(st, "timeline");
    }

    Stmt count(db_, "SELECT COUNT(*) FROM observations WHERE session_id = ? AND deleted_at IS NULL");
    count.bind(session_id);
    if (count.step()) result.total_in_range = static_cast<uint32_t>(count.column_int64(0));
    return result;
}

Stats SqliteStore::stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;

    auto count = [this](const char* sql) -> uint32_t {
        Stmt st(db_, sql);
        return st.step() ? static_cast<uint32_t>(st.column_int64(0)) : 0;
    };
    stats.total_sessions = count("SELECT COUNT(*) FROM sessions");
    stats.total_observations = count("SELECT COUNT(*) FROM observations WHERE deleted_at IS NULL");
    stats.total_prompts = count("SELECT COUNT(*) FROM user_prompts");

    try {
        Stmt st(db_, "SELECT project FROM observations"
                     " WHERE project IS NOT NULL AND deleted_at IS NULL"
                     " GROUP BY project ORDER BY MAX(created_at) DESC");
        while (st.step()) {
            if (!st.column_is_text(0)) {
                std::cerr << "[memory] Skipping unreadable project name in stats\n";
                continue;
            }
            stats.projects.push_back(st.column_text(0));
        }
    } catch (const MemoryError& e) {
        std::cerr << "[memory] Project scan failed: " << e.what() << "\n";
        stats.projects.clear();
    }
    return stats;
}

std::string SqliteStore::format_context(const std::string& project,
                                        std::optional<Scope> scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sessions = recent_sessions_locked(project, 5);
    auto observations = recent_observations_locked(project, scope, config_.max_context_results);
    auto prompts = recent_prompts_locked(project, 10);

    if (sessions.empty() && observations.empty() && prompts.empty()) return "";

    std::ostringstream out;
    out << "## Memory from Previous Sessions\n\n";

    if (!sessions.empty()) {
        out << "### Recent Sessions\n";
        for (const auto& s : sessions) {
            out << "- **" << s.project << "** (" << s.started_at << ")";
            if (s.summary) out << ": " << truncate_text(*s.summary, 200);
            out << " [" << s.observation_count << " observations]\n";
        }
        out << "\n";
    }

    if (!prompts.empty()) {
        out << "### Recent User Prompts\n";
        for (const auto& p : prompts) {
            out << "- " << p.created_at << ": " << truncate_text(p.content, 200) << "\n";
        }
        out << "\n";
    }

    if (!observations.empty()) {
        out << "### Recent Observations\n";
        for (const auto& o : observations) {
            out << "- [" << o.type << "] **" << o.title << "**: "
                << truncate_text(o.content, 300) << "\n";
        }
        out << "\n";
    }
    return out.str();
}

} // namespace hoofy

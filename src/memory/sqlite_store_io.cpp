#include "sqlite_store.hpp"
#include "sqlite_util.hpp"
#include "store_rows.hpp"
#include "entry_json.hpp"
#include "learnings.hpp"
#include "text.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>

namespace hoofy {

static constexpr const char* kExportVersion = "0.1.0";
static constexpr size_t kPassiveTitleLength = 60;

// ── Passive capture ──────────────────────────────────────────────

PassiveCaptureResult SqliteStore::passive_capture(const PassiveCaptureParams& params) {
    PassiveCaptureResult result;
    std::vector<std::string> learnings = extract_learnings(params.content);
    result.extracted = static_cast<uint32_t>(learnings.size());
    if (learnings.empty()) return result;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& learning : learnings) {
        // Narrower than add_observation's dedup: hash + project only
        bool seen;
        {
            Stmt st(db_, "SELECT id FROM observations"
                         " WHERE normalized_hash = ?"
                         "   AND ifnull(project, '') = ifnull(?, '')"
                         "   AND deleted_at IS NULL"
                         " LIMIT 1");
            st.bind(hash_normalized(learning)).bind(nullable(params.project));
            seen = st.step();
        }
        if (seen) {
            result.duplicates++;
            continue;
        }

        AddObservationParams add;
        add.session_id = params.session_id;
        add.type = "passive";
        add.title = truncate_text(learning, kPassiveTitleLength);
        add.content = learning;
        add.project = params.project;
        add.scope = "project";
        add.tool_name = params.source;
        add_observation_locked(add);
        result.saved++;
    }
    return result;
}

// ── Export / Import ──────────────────────────────────────────────

ExportData SqliteStore::export_data() {
    std::lock_guard<std::mutex> lock(mutex_);
    ExportData data;
    data.version = kExportVersion;
    data.exported_at = now_text();

    {
        Stmt st(db_, std::string("SELECT ") + kSessionColumns +
                     " FROM sessions ORDER BY started_at, rowid");
        while (st.step()) {
            if (auto s = session_from_row(st)) {
                data.sessions.push_back(std::move(*s));
                continue;
            }
            std::cerr << "[memory] Skipping unreadable session row in export\n";
        }
    }
    {
        // Tombstoned rows included: export is a full backup
        Stmt st(db_, std::string("SELECT ") + kObservationColumns +
                     " FROM observations ORDER BY id");
        data.observations = collect_observations(st, "export");
    }
    {
        Stmt st(db_, std::string("SELECT ") + kPromptColumns + " FROM user_prompts ORDER BY id");
        data.prompts = collect_prompts(st, "export");
    }
    return data;
}

std::string SqliteStore::export_json() {
    // Rows written by older builds may hold split UTF-8; emit U+FFFD for them
    return export_to_json(export_data())
        .dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

ImportResult SqliteStore::import_data(const ExportData& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    ImportResult result;
    Transaction tx(db_);

    for (const auto& s : data.sessions) {
        Stmt st(db_, "INSERT OR IGNORE INTO sessions"
                     " (id, project, directory, started_at, ended_at, summary)"
                     " VALUES (?, ?, ?, ?, ?, ?)");
        st.bind(s.id).bind(s.project).bind(s.directory)
          .bind(s.started_at.empty() ? now_text() : s.started_at)
          .bind(s.ended_at).bind(s.summary).run();
        result.sessions_imported += static_cast<uint32_t>(st.changes());
    }

    // Fresh ids; no dedup or topic upsert against existing rows
    for (const auto& o : data.observations) {
        std::string now = now_text();
        Stmt st(db_,
            "INSERT INTO observations (session_id, type, title, content, tool_name, project,"
            " scope, topic_key, normalized_hash, revision_count, duplicate_count, last_seen_at,"
            " created_at, updated_at, deleted_at)"
            " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        st.bind(o.session_id).bind(o.type).bind(o.title).bind(o.content)
          .bind(o.tool_name).bind(o.project)
          .bind(scope_to_string(o.scope))
          .bind(nullable(normalize_topic_key(o.topic_key.value_or(""))))
          .bind(hash_normalized(o.content))
          .bind(std::max(o.revision_count, 1))
          .bind(std::max(o.duplicate_count, 1))
          .bind(o.last_seen_at)
          .bind(o.created_at.empty() ? now : o.created_at)
          .bind(o.updated_at.empty() ? now : o.updated_at)
          .bind(o.deleted_at);
        try {
            st.run();
        } catch (const MemoryError& e) {
            throw MemoryError(e.kind(), "import observation " + std::to_string(o.id) + ": " +
                                        e.what());
        }
        result.observations_imported++;
    }

    for (const auto& p : data.prompts) {
        Stmt st(db_, "INSERT INTO user_prompts (session_id, content, project, created_at)"
                     " VALUES (?, ?, ?, ?)");
        st.bind(p.session_id).bind(p.content).bind(p.project)
          .bind(p.created_at.empty() ? now_text() : p.created_at);
        try {
            st.run();
        } catch (const MemoryError& e) {
            throw MemoryError(e.kind(), "import prompt " + std::to_string(p.id) + ": " +
                                        e.what());
        }
        result.prompts_imported++;
    }

    tx.commit();
    return result;
}

ImportResult SqliteStore::import_json(const std::string& text) {
    ExportData data;
    try {
        auto doc = nlohmann::json::parse(text);
        if (!doc.is_object()) {
            throw MemoryError(ErrorKind::InvalidArgument, "import: document must be a JSON object");
        }
        data = export_from_json(doc);
    } catch (const nlohmann::json::exception& e) {
        throw MemoryError(ErrorKind::InvalidArgument, std::string("import: ") + e.what());
    }
    return import_data(data);
}

} // namespace hoofy

#pragma once
#include "../memory.hpp"
#include "sqlite_util.hpp"
#include <optional>
#include <vector>

namespace hoofy {

// Column lists matching the row readers below, in order
inline constexpr const char* kObservationColumns =
    "id, session_id, type, title, content, tool_name, project, scope, topic_key, "
    "revision_count, duplicate_count, last_seen_at, created_at, updated_at, deleted_at";
inline constexpr const char* kSessionColumns =
    "id, project, directory, started_at, ended_at, summary";
inline constexpr const char* kPromptColumns =
    "id, session_id, content, ifnull(project, ''), created_at";

// Row readers return nullopt when a column holds a value of the wrong
// storage class (e.g. a BLOB where text is expected).
std::optional<Observation> observation_from_row(const Stmt& st);
std::optional<Session> session_from_row(const Stmt& st);
std::optional<Prompt> prompt_from_row(const Stmt& st);

// Step through every row, skipping (and logging) unreadable ones. `scan`
// names the query in the log line.
std::vector<Observation> collect_observations(Stmt& st, const char* scan);
std::vector<Prompt> collect_prompts(Stmt& st, const char* scan);

} // namespace hoofy

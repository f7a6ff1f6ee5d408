#include "store_rows.hpp"
#include <iostream>

namespace hoofy {

namespace {

bool read_text(const Stmt& st, int col, std::string& out) {
    if (!st.column_is_text(col)) return false;
    out = st.column_text(col);
    return true;
}

bool read_optional_text(const Stmt& st, int col, std::optional<std::string>& out) {
    if (st.column_is_null(col)) {
        out.reset();
        return true;
    }
    if (!st.column_is_text(col)) return false;
    out = st.column_text(col);
    return true;
}

} // namespace

std::optional<Observation> observation_from_row(const Stmt& st) {
    Observation o;
    std::string scope;
    o.id = st.column_int64(0);
    bool ok = read_text(st, 1, o.session_id) &&
              read_text(st, 2, o.type) &&
              read_text(st, 3, o.title) &&
              read_text(st, 4, o.content) &&
              read_optional_text(st, 5, o.tool_name) &&
              read_optional_text(st, 6, o.project) &&
              read_text(st, 7, scope) &&
              read_optional_text(st, 8, o.topic_key);
    if (!ok) return std::nullopt;
    o.scope = scope_from_string(scope);
    o.revision_count = st.column_int(9);
    o.duplicate_count = st.column_int(10);
    ok = read_optional_text(st, 11, o.last_seen_at) &&
         read_text(st, 12, o.created_at) &&
         read_text(st, 13, o.updated_at) &&
         read_optional_text(st, 14, o.deleted_at);
    if (!ok) return std::nullopt;
    return o;
}

std::optional<Session> session_from_row(const Stmt& st) {
    Session s;
    bool ok = read_text(st, 0, s.id) &&
              read_text(st, 1, s.project) &&
              read_text(st, 2, s.directory) &&
              read_text(st, 3, s.started_at) &&
              read_optional_text(st, 4, s.ended_at) &&
              read_optional_text(st, 5, s.summary);
    if (!ok) return std::nullopt;
    return s;
}

std::optional<Prompt> prompt_from_row(const Stmt& st) {
    Prompt p;
    p.id = st.column_int64(0);
    bool ok = read_text(st, 1, p.session_id) &&
              read_text(st, 2, p.content) &&
              read_text(st, 3, p.project) &&
              read_text(st, 4, p.created_at);
    if (!ok) return std::nullopt;
    return p;
}

std::vector<Observation> collect_observations(Stmt& st, const char* scan) {
    std::vector<Observation> out;
    while (st.step()) {
        if (auto o = observation_from_row(st)) {
            out.push_back(std::move(*o));
            continue;
        }
        std::cerr << "[memory] Skipping unreadable observation #" << st.column_int64(0)
                  << " in " << scan << "\n";
    }
    return out;
}

std::vector<Prompt> collect_prompts(Stmt& st, const char* scan) {
    std::vector<Prompt> out;
    while (st.step()) {
        if (auto p = prompt_from_row(st)) {
            out.push_back(std::move(*p));
            continue;
        }
        std::cerr << "[memory] Skipping unreadable prompt #" << st.column_int64(0)
                  << " in " << scan << "\n";
    }
    return out;
}

} // namespace hoofy

#pragma once
#include "../memory.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <limits>

namespace hoofy {

// JSON <-> record conversion for the export document. Optional fields are
// omitted when absent; from_json throws nlohmann::json::exception when a
// required field is missing or has the wrong type.

namespace detail {

inline void put_optional(nlohmann::json& j, const char* key,
                         const std::optional<std::string>& v) {
    if (v) j[key] = *v;
}

inline std::optional<std::string> get_optional(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

// Counters floor at 1 and saturate at INT_MAX
inline int get_counter(const nlohmann::json& j, const char* key) {
    constexpr int kMax = std::numeric_limits<int>::max();
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return 1;
    if (it->is_number_unsigned()) {
        uint64_t v = it->get<uint64_t>();
        if (v > static_cast<uint64_t>(kMax)) return kMax;
        return std::max(static_cast<int>(v), 1);
    }
    if (it->is_number_integer()) {
        int64_t v = it->get<int64_t>();
        return static_cast<int>(std::clamp<int64_t>(v, 1, kMax));
    }
    double v = it->get<double>();
    if (!(v >= 1.0)) return 1;
    if (v >= static_cast<double>(kMax)) return kMax;
    return static_cast<int>(v);
}

} // namespace detail

inline nlohmann::json session_to_json(const Session& s) {
    nlohmann::json item = {
        {"id", s.id},
        {"project", s.project},
        {"directory", s.directory},
        {"started_at", s.started_at}
    };
    detail::put_optional(item, "ended_at", s.ended_at);
    detail::put_optional(item, "summary", s.summary);
    return item;
}

inline Session session_from_json(const nlohmann::json& item) {
    Session s;
    s.id = item.at("id").get<std::string>();
    s.project = item.value("project", "");
    s.directory = item.value("directory", "");
    s.started_at = item.value("started_at", "");
    s.ended_at = detail::get_optional(item, "ended_at");
    s.summary = detail::get_optional(item, "summary");
    return s;
}

inline nlohmann::json observation_to_json(const Observation& o) {
    nlohmann::json item = {
        {"id", o.id},
        {"session_id", o.session_id},
        {"type", o.type},
        {"title", o.title},
        {"content", o.content},
        {"scope", scope_to_string(o.scope)},
        {"revision_count", o.revision_count},
        {"duplicate_count", o.duplicate_count},
        {"created_at", o.created_at},
        {"updated_at", o.updated_at}
    };
    detail::put_optional(item, "tool_name", o.tool_name);
    detail::put_optional(item, "project", o.project);
    detail::put_optional(item, "topic_key", o.topic_key);
    detail::put_optional(item, "last_seen_at", o.last_seen_at);
    detail::put_optional(item, "deleted_at", o.deleted_at);
    return item;
}

inline Observation observation_from_json(const nlohmann::json& item) {
    Observation o;
    o.id = item.value("id", int64_t{0});
    o.session_id = item.at("session_id").get<std::string>();
    o.type = item.at("type").get<std::string>();
    o.title = item.at("title").get<std::string>();
    o.content = item.at("content").get<std::string>();
    o.tool_name = detail::get_optional(item, "tool_name");
    o.project = detail::get_optional(item, "project");
    o.scope = scope_from_string(item.value("scope", ""));
    o.topic_key = detail::get_optional(item, "topic_key");
    o.revision_count = detail::get_counter(item, "revision_count");
    o.duplicate_count = detail::get_counter(item, "duplicate_count");
    o.last_seen_at = detail::get_optional(item, "last_seen_at");
    o.created_at = item.value("created_at", "");
    o.updated_at = item.value("updated_at", "");
    o.deleted_at = detail::get_optional(item, "deleted_at");
    return o;
}

inline nlohmann::json prompt_to_json(const Prompt& p) {
    nlohmann::json item = {
        {"id", p.id},
        {"session_id", p.session_id},
        {"content", p.content},
        {"created_at", p.created_at}
    };
    if (!p.project.empty()) item["project"] = p.project;
    return item;
}

inline Prompt prompt_from_json(const nlohmann::json& item) {
    Prompt p;
    p.id = item.value("id", int64_t{0});
    p.session_id = item.at("session_id").get<std::string>();
    p.content = item.at("content").get<std::string>();
    p.project = item.value("project", "");
    p.created_at = item.value("created_at", "");
    return p;
}

inline nlohmann::json export_to_json(const ExportData& data) {
    nlohmann::json doc = {
        {"version", data.version},
        {"exported_at", data.exported_at},
        {"sessions", nlohmann::json::array()},
        {"observations", nlohmann::json::array()},
        {"prompts", nlohmann::json::array()}
    };
    for (const auto& s : data.sessions) doc["sessions"].push_back(session_to_json(s));
    for (const auto& o : data.observations) doc["observations"].push_back(observation_to_json(o));
    for (const auto& p : data.prompts) doc["prompts"].push_back(prompt_to_json(p));
    return doc;
}

inline ExportData export_from_json(const nlohmann::json& doc) {
    ExportData data;
    data.version = doc.at("version").get<std::string>();
    data.exported_at = doc.value("exported_at", "");
    // get_ref throws type_error when a collection is not an array
    using array_t = nlohmann::json::array_t;
    if (doc.contains("sessions") && !doc["sessions"].is_null()) {
        for (const auto& item : doc["sessions"].get_ref<const array_t&>()) {
            data.sessions.push_back(session_from_json(item));
        }
    }
    if (doc.contains("observations") && !doc["observations"].is_null()) {
        for (const auto& item : doc["observations"].get_ref<const array_t&>()) {
            data.observations.push_back(observation_from_json(item));
        }
    }
    if (doc.contains("prompts") && !doc["prompts"].is_null()) {
        for (const auto& item : doc["prompts"].get_ref<const array_t&>()) {
            data.prompts.push_back(prompt_from_json(item));
        }
    }
    return data;
}

} // namespace hoofy

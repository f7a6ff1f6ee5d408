#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <functional>

namespace hoofy {

enum class Scope { Project, Personal };

// Verbosity for formatted output: ids/titles only, snippets, or full content
enum class DetailLevel { Summary, Standard, Full };

enum class Direction { Outgoing, Incoming };

// Source of "now" in Unix epoch seconds. Tests pin it to a fixed value.
using Clock = std::function<uint64_t()>;

struct Session {
    std::string id;
    std::string project;
    std::string directory;
    std::string started_at;
    std::optional<std::string> ended_at;
    std::optional<std::string> summary;
};

struct Observation {
    int64_t id = 0;
    std::string session_id;
    std::string type;
    std::string title;
    std::string content;
    std::optional<std::string> tool_name;
    std::optional<std::string> project;
    Scope scope = Scope::Project;
    std::optional<std::string> topic_key;
    int revision_count = 1;
    int duplicate_count = 1;
    std::optional<std::string> last_seen_at;
    std::string created_at;
    std::string updated_at;
    std::optional<std::string> deleted_at;  // set = soft-deleted
};

struct SearchResult {
    Observation observation;
    double rank = 0.0;  // FTS5 rank, lower is better; 0 for recency fallback
};

struct Relation {
    int64_t id = 0;
    int64_t from_id = 0;
    int64_t to_id = 0;
    std::string type;
    std::string note;
    std::string created_at;
};

struct AddRelationParams {
    int64_t from_id = 0;
    int64_t to_id = 0;
    std::string type;           // empty = "relates_to"
    std::string note;
    bool bidirectional = false;
};

// One observation reached by BuildContext, with the edge that reached it
struct ContextNode {
    int64_t id = 0;
    std::string title;
    std::string type;
    std::string project;
    std::string created_at;
    std::string relation_type;
    Direction direction = Direction::Outgoing;
    std::string note;
    int depth = 0;
};

struct ContextResult {
    Observation root;
    std::vector<ContextNode> connected;  // discovery order
    uint32_t total_nodes = 0;
    int max_depth = 0;                   // deepest level actually reached
};

struct SessionSummary {
    std::string id;
    std::string project;
    std::string started_at;
    std::optional<std::string> ended_at;
    std::optional<std::string> summary;
    uint32_t observation_count = 0;
};

struct Stats {
    uint32_t total_sessions = 0;
    uint32_t total_observations = 0;
    uint32_t total_prompts = 0;
    std::vector<std::string> projects;
};

struct TimelineResult {
    Observation focus;
    std::vector<Observation> before;   // chronological
    std::vector<Observation> after;    // chronological
    std::optional<Session> session;
    uint32_t total_in_range = 0;       // non-deleted observations in the session
};

struct SearchOptions {
    std::string type;
    std::string project;
    std::optional<Scope> scope;
    uint32_t limit = 0;  // 0 = default (10), capped by max_search_results
};

struct AddObservationParams {
    std::string session_id;
    std::string type;
    std::string title;
    std::string content;
    std::string tool_name;
    std::string project;
    std::string scope;      // normalized: anything but "personal" is project
    std::string topic_key;
};

// Only engaged fields are applied
struct UpdateObservationParams {
    std::optional<std::string> type;
    std::optional<std::string> title;
    std::optional<std::string> content;
    std::optional<std::string> project;
    std::optional<std::string> scope;
    std::optional<std::string> topic_key;
};

struct Prompt {
    int64_t id = 0;
    std::string session_id;
    std::string content;
    std::string project;
    std::string created_at;
};

struct AddPromptParams {
    std::string session_id;
    std::string content;
    std::string project;
};

struct ExportData {
    std::string version;
    std::string exported_at;
    std::vector<Session> sessions;
    std::vector<Observation> observations;
    std::vector<Prompt> prompts;
};

struct ImportResult {
    uint32_t sessions_imported = 0;
    uint32_t observations_imported = 0;
    uint32_t prompts_imported = 0;
};

struct PassiveCaptureParams {
    std::string session_id;
    std::string content;
    std::string project;
    std::string source;     // stored as tool_name
};

struct PassiveCaptureResult {
    uint32_t extracted = 0;
    uint32_t saved = 0;
    uint32_t duplicates = 0;
};

struct CompactParams {
    std::vector<int64_t> ids;
    std::string summary_title;
    std::string summary_content;
    std::string project;
    std::string scope;
    std::string session_id;
};

struct CompactResult {
    uint32_t deleted_count = 0;
    uint32_t total_before = 0;
    uint32_t total_after = 0;
    std::optional<int64_t> summary_id;
};

// Enum string conversions
std::string scope_to_string(Scope scope);
Scope scope_from_string(const std::string& s);

std::string direction_to_string(Direction d);

std::string detail_level_to_string(DetailLevel level);
DetailLevel parse_detail_level(const std::string& s);

// Render search hits for display at the requested verbosity.
std::string format_search_results(const std::vector<SearchResult>& results,
                                  DetailLevel level);

// Render a BuildContext result grouped by depth.
std::string format_context_graph(const ContextResult& result);

} // namespace hoofy

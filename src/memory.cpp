#include "memory.hpp"
#include "util.hpp"
#include <map>
#include <sstream>

namespace hoofy {

std::string scope_to_string(Scope scope) {
    switch (scope) {
        case Scope::Project:  return "project";
        case Scope::Personal: return "personal";
    }
    return "project";
}

Scope scope_from_string(const std::string& s) {
    if (to_lower(trim(s)) == "personal") return Scope::Personal;
    return Scope::Project;
}

std::string direction_to_string(Direction d) {
    return d == Direction::Incoming ? "incoming" : "outgoing";
}

std::string detail_level_to_string(DetailLevel level) {
    switch (level) {
        case DetailLevel::Summary:  return "summary";
        case DetailLevel::Standard: return "standard";
        case DetailLevel::Full:     return "full";
    }
    return "standard";
}

DetailLevel parse_detail_level(const std::string& s) {
    if (s == "summary") return DetailLevel::Summary;
    if (s == "full")    return DetailLevel::Full;
    return DetailLevel::Standard;
}

std::string format_search_results(const std::vector<SearchResult>& results,
                                  DetailLevel level) {
    if (results.empty()) return "No memories found matching your query.";

    std::ostringstream ss;
    ss << "Found " << results.size() << " memories:\n\n";

    size_t n = 0;
    for (const auto& r : results) {
        const auto& o = r.observation;
        ss << "[" << ++n << "] #" << o.id << " (" << o.type << ") - " << o.title << "\n";
        if (level == DetailLevel::Summary) continue;

        ss << "    " << (level == DetailLevel::Full ? o.content : truncate_text(o.content, 300))
           << "\n    " << o.project.value_or("");
        if (o.topic_key && !o.topic_key->empty()) {
            ss << " | topic: " << *o.topic_key;
        }
        ss << " | scope: " << scope_to_string(o.scope) << "\n\n";
    }

    if (level == DetailLevel::Summary) {
        ss << "\n---\nUse detail_level: standard or full for more detail.";
    }
    return ss.str();
}

std::string format_context_graph(const ContextResult& result) {
    std::ostringstream ss;
    const auto& root = result.root;
    ss << "# Context Graph for #" << root.id << ": \"" << root.title << "\"\n\n";
    ss << "**Type:** " << root.type << "\n";
    if (root.project && !root.project->empty()) {
        ss << "**Project:** " << *root.project << "\n";
    }
    ss << "**Created:** " << root.created_at << "\n\n";

    if (result.connected.empty()) {
        ss << "No relations found for this observation.\n";
        return ss.str();
    }

    std::map<int, std::vector<const ContextNode*>> by_depth;
    for (const auto& node : result.connected) {
        by_depth[node.depth].push_back(&node);
    }

    for (const auto& [depth, nodes] : by_depth) {
        if (depth == 1) {
            ss << "## Direct Relations (depth 1)\n\n";
        } else {
            ss << "## Depth " << depth << " Relations (depth " << depth << ")\n\n";
        }
        for (const auto* node : nodes) {
            ss << "- " << (node->direction == Direction::Incoming ? "<-" : "->")
               << " #" << node->id << " [" << node->type << "] \"" << node->title
               << "\" (" << node->relation_type << ")";
            if (!node->note.empty()) ss << ": " << node->note;
            ss << "\n";
        }
        ss << "\n";
    }

    ss << "**Total:** " << result.total_nodes << " connected observations across "
       << result.max_depth << " level(s)\n";
    return ss.str();
}

} // namespace hoofy

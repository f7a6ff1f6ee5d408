#include "text.hpp"
#include "../util.hpp"
#include <regex>

namespace hoofy {

std::string strip_private_tags(const std::string& s) {
    static const std::regex private_tag(R"(<private>[\s\S]*?</private>)",
                                        std::regex::ECMAScript | std::regex::icase);
    return trim(std::regex_replace(s, private_tag, kRedactedToken));
}

std::string cap_content(const std::string& content, size_t max_len) {
    if (content.size() <= max_len) return content;
    return content.substr(0, utf8_cut_position(content, max_len)) + kTruncatedMarker;
}

std::string normalize_topic_key(const std::string& topic) {
    std::string v = to_lower(trim(topic));
    if (v.empty()) return "";
    v = join(split_fields(v), "-");
    if (v.size() > kMaxTopicKeyLength) v.resize(utf8_cut_position(v, kMaxTopicKeyLength));
    return v;
}

std::string hash_normalized(const std::string& content) {
    return sha256_hex(to_lower(collapse_whitespace(content)));
}

std::string sanitize_fts(const std::string& query) {
    std::vector<std::string> phrases;
    for (const auto& w : split_fields(query)) {
        // Embedded quotes would close the phrase early
        std::string bare = replace_all(w, "\"", "");
        if (bare.empty()) continue;
        phrases.push_back("\"" + bare + "\"");
    }
    return join(phrases, " ");
}

// Lower-case alphanumerics joined by '-', at most 100 chars
static std::string normalize_topic_segment(const std::string& s) {
    std::string v = to_lower(trim(s));
    if (v.empty()) return "";
    std::string spaced;
    spaced.reserve(v.size());
    for (char c : v) {
        bool alnum = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
        spaced += alnum ? c : ' ';
    }
    v = join(split_fields(spaced), "-");
    if (v.size() > 100) v.resize(100);
    return v;
}

static bool has_any(const std::string& text, std::initializer_list<const char*> words) {
    for (const char* w : words) {
        if (text.find(w) != std::string::npos) return true;
    }
    return false;
}

static std::string infer_topic_family(const std::string& type, const std::string& title,
                                      const std::string& content) {
    std::string t = to_lower(trim(type));
    if (t == "architecture" || t == "design" || t == "adr" || t == "refactor")
        return "architecture";
    if (t == "bug" || t == "bugfix" || t == "fix" || t == "incident" || t == "hotfix")
        return "bug";
    if (t == "decision")
        return "decision";
    if (t == "pattern" || t == "convention" || t == "guideline")
        return "pattern";
    if (t == "config" || t == "setup" || t == "infra" || t == "infrastructure" || t == "ci")
        return "config";
    if (t == "discovery" || t == "investigation" || t == "root_cause" || t == "root-cause")
        return "discovery";
    if (t == "learning" || t == "learn")
        return "learning";
    if (t == "session_summary")
        return "session";

    std::string text = to_lower(title + " " + content);
    if (has_any(text, {"bug", "fix", "panic", "error", "crash", "regression", "incident", "hotfix"}))
        return "bug";
    if (has_any(text, {"architecture", "design", "adr", "boundary", "hexagonal", "refactor"}))
        return "architecture";
    if (has_any(text, {"decision", "tradeoff", "chose", "choose", "decide"}))
        return "decision";
    if (has_any(text, {"pattern", "convention", "naming", "guideline"}))
        return "pattern";
    if (has_any(text, {"config", "setup", "environment", "env", "docker", "pipeline"}))
        return "config";
    if (has_any(text, {"discovery", "investigate", "investigation", "found", "root cause"}))
        return "discovery";
    if (has_any(text, {"learned", "learning"}))
        return "learning";

    if (!t.empty() && t != "manual") {
        std::string seg = normalize_topic_segment(t);
        if (!seg.empty()) return seg;
    }
    return "topic";
}

std::string suggest_topic_key(const std::string& type, const std::string& title,
                              const std::string& content) {
    std::string family = infer_topic_family(type, title, content);
    std::string segment = normalize_topic_segment(strip_private_tags(title));

    if (segment.empty()) {
        auto words = split_fields(to_lower(strip_private_tags(content)));
        if (words.size() > 8) words.resize(8);
        segment = normalize_topic_segment(join(words, " "));
    }
    if (segment.empty()) segment = "general";

    std::string prefix = family + "-";
    if (segment.compare(0, prefix.size(), prefix) == 0) {
        segment = segment.substr(prefix.size());
    }
    if (segment.empty() || segment == family) segment = "general";

    return family + "/" + segment;
}

std::string classify_tool(const std::string& tool_name) {
    if (tool_name == "write" || tool_name == "edit" || tool_name == "patch") return "file_change";
    if (tool_name == "bash") return "command";
    if (tool_name == "read" || tool_name == "view") return "file_read";
    if (tool_name == "grep" || tool_name == "glob" || tool_name == "ls") return "search";
    return "tool_use";
}

} // namespace hoofy

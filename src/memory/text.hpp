#pragma once
#include <string>
#include <vector>

namespace hoofy {

inline constexpr const char* kRedactedToken = "[REDACTED]";
inline constexpr const char* kTruncatedMarker = "... [truncated]";
inline constexpr const char* kDefaultRelationType = "relates_to";
inline constexpr size_t kMaxTopicKeyLength = 120;

// Replace every <private>...</private> span (case-insensitive, may span
// lines) with [REDACTED], then trim.
std::string strip_private_tags(const std::string& s);

// Cap content at max_len bytes, appending the truncation marker when cut.
std::string cap_content(const std::string& content, size_t max_len);

// Lower-case, whitespace runs -> '-', capped at 120 chars. Empty stays empty.
std::string normalize_topic_key(const std::string& topic);

// SHA-256 of the whitespace-collapsed, lower-cased content.
std::string hash_normalized(const std::string& content);

// Quote each whitespace-separated token for FTS5 MATCH, dropping quote
// characters. Tokens left empty are skipped; no tokens -> "".
// "fix auth bug" -> "\"fix\" \"auth\" \"bug\""
std::string sanitize_fts(const std::string& query);

// Stable "family/segment" topic key from an observation's type/title/content.
std::string suggest_topic_key(const std::string& type, const std::string& title,
                              const std::string& content);

// Observation type for a tool name (file_change, command, file_read, search, tool_use).
std::string classify_tool(const std::string& tool_name);

} // namespace hoofy

#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace hoofy {

// Unix epoch seconds
uint64_t epoch_seconds();

// UTC "YYYY-MM-DD HH:MM:SS", the form SQLite's datetime() produces
std::string format_sqlite_time(uint64_t epoch);

// Trim whitespace
std::string trim(const std::string& s);

// Split on runs of whitespace, dropping empty fields
std::vector<std::string> split_fields(const std::string& s);

// Join with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// ASCII lower-case
std::string to_lower(const std::string& s);

// Collapse every whitespace run to a single space and trim the ends
std::string collapse_whitespace(const std::string& s);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Largest cut position <= max that does not split a UTF-8 sequence
size_t utf8_cut_position(const std::string& s, size_t max);

// Shorten to at most max bytes on a character boundary, appending "..." when cut
std::string truncate_text(const std::string& s, size_t max);

// Lower-case hex SHA-256 digest
std::string sha256_hex(const std::string& data);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace hoofy

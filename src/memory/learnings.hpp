#pragma once
#include <string>
#include <vector>

namespace hoofy {

// Cleaned items shorter than this are ignored
inline constexpr size_t kMinLearningLength = 20;

// Pull list items out of the last "## Key Learnings" style section that
// yields any. Numbered items win over bullets; "Aprendizajes (Clave)" and
// "Learning(s)" headers are accepted at levels 2 and 3.
std::vector<std::string> extract_learnings(const std::string& text);

// Strip **bold**, `code` and *italic* markers and collapse whitespace.
std::string clean_markdown(const std::string& s);

} // namespace hoofy

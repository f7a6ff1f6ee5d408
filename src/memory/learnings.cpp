#include "learnings.hpp"
#include "../util.hpp"
#include <regex>
#include <sstream>

namespace hoofy {

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

// Cleaned capture group 1 of every line matching re, if long enough
std::vector<std::string> collect_items(const std::vector<std::string>& lines,
                                       const std::regex& re) {
    std::vector<std::string> items;
    std::smatch m;
    for (const auto& line : lines) {
        if (!std::regex_match(line, m, re)) continue;
        std::string cleaned = clean_markdown(m[1].str());
        if (cleaned.size() >= kMinLearningLength) {
            items.push_back(cleaned);
        }
    }
    return items;
}

} // namespace

std::string clean_markdown(const std::string& s) {
    static const std::regex bold(R"(\*\*([^*]+)\*\*)");
    static const std::regex code("`([^`]+)`");
    static const std::regex italic(R"(\*([^*]+)\*)");

    std::string out = std::regex_replace(s, bold, "$1");
    out = std::regex_replace(out, code, "$1");
    out = std::regex_replace(out, italic, "$1");
    return collapse_whitespace(out);
}

std::vector<std::string> extract_learnings(const std::string& text) {
    static const std::regex header(
        R"(#{2,3}\s+(?:aprendizajes(?:\s+clave)?|key\s+learnings?|learnings?):?\s*)",
        std::regex::ECMAScript | std::regex::icase);
    static const std::regex next_section(R"(#{1,3} .*)");
    static const std::regex numbered(R"(\s*\d+[.)]\s+(.+))");
    static const std::regex bullet(R"(\s*[-*]\s+(.+))");

    std::vector<std::string> lines = split_lines(text);

    std::vector<size_t> headers;
    for (size_t i = 0; i < lines.size(); i++) {
        if (std::regex_match(lines[i], header)) headers.push_back(i);
    }

    // Latest section first; stop at the first one that yields anything
    for (auto it = headers.rbegin(); it != headers.rend(); ++it) {
        std::vector<std::string> body;
        for (size_t i = *it + 1; i < lines.size(); i++) {
            if (std::regex_match(lines[i], next_section)) break;
            body.push_back(lines[i]);
        }

        auto items = collect_items(body, numbered);
        if (items.empty()) items = collect_items(body, bullet);
        if (!items.empty()) return items;
    }
    return {};
}

} // namespace hoofy

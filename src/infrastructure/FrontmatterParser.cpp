/**
 * @file FrontmatterParser.cpp
 * @brief Implementation of FrontmatterParser.
 */

#include "infrastructure/FrontmatterParser.hpp"
#include <sstream>
#include <vector>

namespace quire::infrastructure {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

} // namespace

ParsedSource FrontmatterParser::Parse(const std::string& text, const std::string& defaultLayout) {
    ParsedSource parsed;
    parsed.frontmatter.layout = defaultLayout;
    parsed.body = text;

    std::stringstream ss(text);
    std::string line;
    if (!std::getline(ss, line) || trim(line) != "---") {
        return parsed;
    }

    std::vector<std::string> entries;
    bool closed = false;
    while (std::getline(ss, line)) {
        if (trim(line) == "---") {
            closed = true;
            break;
        }
        entries.push_back(line);
    }
    if (!closed) {
        return parsed;
    }

    // Whatever follows the closing delimiter is the body.
    auto bodyStart = ss.tellg();
    parsed.body = bodyStart == std::streampos(-1) ? "" : text.substr(static_cast<std::size_t>(bodyStart));

    for (const auto& entry : entries) {
        std::string trimmed = trim(entry);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        auto colon = trimmed.find(':');
        if (colon == std::string::npos) continue;

        std::string key = trim(trimmed.substr(0, colon));
        std::string rawValue = trim(trimmed.substr(colon + 1));
        if (key.empty()) continue;

        if (key == "layout") {
            parsed.frontmatter.layout = unquote(rawValue);
        } else if (key == "title") {
            parsed.frontmatter.title = unquote(rawValue);
        } else if (key == "date") {
            parsed.frontmatter.date = unquote(rawValue);
        } else if (rawValue == "true" || rawValue == "false") {
            parsed.frontmatter.metadata[key] = (rawValue == "true");
        } else {
            parsed.frontmatter.metadata[key] = unquote(rawValue);
        }
    }
    return parsed;
}

} // namespace quire::infrastructure

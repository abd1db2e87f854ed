#include "mdexpand/symbols.hpp"

#include <algorithm>
#include <regex>
#include <vector>

namespace mdexpand {

namespace {

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = content.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines, size_t from, size_t to) {
    std::string out;
    for (size_t i = from; i < to; ++i) {
        if (i > from) out += '\n';
        out += lines[i];
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(start, end - start + 1);
}

bool ends_with(const std::string& s, char c) {
    return !s.empty() && s.back() == c;
}

// '$' is legal in identifiers and must not act as an anchor
std::string escape_identifier(const std::string& name) {
    std::string out;
    for (char c : name) {
        if (c == '$') out += '\\';
        out += c;
    }
    return out;
}

std::vector<std::regex> declaration_patterns(const std::string& symbol) {
    std::string n = escape_identifier(symbol);
    return {
        std::regex(R"(^(export\s+)?interface\s+)" + n + R"(\s*(extends\s+[^{]+)?\{)"),
        std::regex(R"(^(export\s+)?type\s+)" + n + R"(\s*(<[^>]+>)?\s*=)"),
        std::regex(R"(^(export\s+)?(async\s+)?function\s+)" + n + R"(\s*(<[^>]+>)?\s*\()"),
        std::regex(R"(^(export\s+)?(abstract\s+)?class\s+)" + n +
                   R"(\s*(extends\s+[^{]+)?(implements\s+[^{]+)?\{)"),
        std::regex(R"(^(export\s+)?(const|let|var)\s+)" + n + R"(\s*(:[^=]+)?\s*=)"),
        std::regex(R"(^(export\s+)?enum\s+)" + n + R"(\s*\{)"),
    };
}

} // namespace

std::string extract_lines(const std::string& content, int start, int end) {
    auto lines = split_lines(content);
    size_t n = lines.size();
    size_t start_idx = static_cast<size_t>(std::max(0, start - 1));
    size_t end_idx = end < 0 ? 0 : std::min(n, static_cast<size_t>(end));
    if (start_idx >= end_idx) {
        return "";
    }
    return join_lines(lines, start_idx, end_idx);
}

Result<std::string> extract_symbol(const std::string& content, const std::string& symbol) {
    auto lines = split_lines(content);
    auto patterns = declaration_patterns(symbol);

    bool found = false;
    size_t start_line = 0;
    int brace_depth = 0;
    int paren_depth = 0;
    bool in_string = false;
    char string_char = 0;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& current = lines[i];
        if (current.empty()) continue;

        if (!found) {
            std::string line = trim(current);
            for (const auto& pattern : patterns) {
                if (std::regex_search(line, pattern)) {
                    found = true;
                    start_line = i;
                    break;
                }
            }
        }

        if (!found) continue;

        for (size_t j = 0; j < current.size(); ++j) {
            char c = current[j];
            char prev = j > 0 ? current[j - 1] : '\0';

            if (!in_string && (c == '"' || c == '\'' || c == '`')) {
                in_string = true;
                string_char = c;
            } else if (in_string && c == string_char && prev != '\\') {
                in_string = false;
            }

            if (!in_string) {
                if (c == '{') ++brace_depth;
                else if (c == '}') --brace_depth;
                else if (c == '(') ++paren_depth;
                else if (c == ')') --paren_depth;
            }
        }

        if (brace_depth == 0 && paren_depth == 0) {
            std::string trimmed = trim(current);
            bool next_starts_statement = i + 1 < lines.size() && !lines[i + 1].empty() &&
                                         trim(lines[i + 1]).rfind('.', 0) != 0;
            if (ends_with(trimmed, ';') || ends_with(trimmed, '}') || next_starts_statement) {
                return Result<std::string>::ok(join_lines(lines, start_line, i + 1));
            }
        }
    }

    if (found) {
        return Result<std::string>::ok(join_lines(lines, start_line, lines.size()));
    }

    return Result<std::string>::err(Error(
        ErrorCode::SYMBOL_NOT_FOUND,
        "Symbol \"" + symbol + "\" not found in file",
        {{"symbol", symbol}}));
}

} // namespace mdexpand

#include "mdexpand/template.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace mdexpand {

namespace {

bool is_identifier(const std::string& name) {
    if (name.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(name[0])) && name[0] != '_') return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

std::string trim_spaces(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

const std::regex& raw_open_regex() {
    static const std::regex re(R"(\{%-?\s*raw\s*-?%\})");
    return re;
}

const std::regex& raw_close_regex() {
    static const std::regex re(R"(\{%-?\s*endraw\s*-?%\})");
    return re;
}

} // namespace

std::string substitute(const std::string& text,
                       const std::unordered_map<std::string, std::string>& vars,
                       std::vector<std::string>& missing) {
    std::string output;
    output.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text.compare(i, 2, "{%") == 0) {
            std::smatch open;
            auto from = text.begin() + static_cast<std::ptrdiff_t>(i);
            if (std::regex_search(from, text.end(), open, raw_open_regex(),
                                  std::regex_constants::match_continuous)) {
                // Copy through the matching endraw, or to the end when unclosed
                size_t body = i + static_cast<size_t>(open.length(0));
                std::smatch close;
                auto body_it = text.begin() + static_cast<std::ptrdiff_t>(body);
                size_t stop = text.size();
                if (std::regex_search(body_it, text.end(), close, raw_close_regex())) {
                    stop = body + static_cast<size_t>(close.position(0) + close.length(0));
                }
                output.append(text, i, stop - i);
                i = stop;
                continue;
            }
        }

        if (text.compare(i, 2, "{{") == 0) {
            size_t close = text.find("}}", i + 2);
            if (close != std::string::npos) {
                std::string name = trim_spaces(text.substr(i + 2, close - i - 2));
                if (is_identifier(name)) {
                    auto it = vars.find(name);
                    if (it != vars.end()) {
                        output += it->second;
                    } else {
                        if (std::find(missing.begin(), missing.end(), name) == missing.end()) {
                            missing.push_back(name);
                        }
                        output.append(text, i, close + 2 - i);
                    }
                    i = close + 2;
                    continue;
                }
            }
        }

        output += text[i];
        ++i;
    }

    return output;
}

std::string substitute(const std::string& text,
                       const std::unordered_map<std::string, std::string>& vars) {
    std::vector<std::string> missing;
    return substitute(text, vars, missing);
}

std::string wrap_raw(const std::string& text) {
    return std::string(RAW_OPEN) + RAW_SENTINEL + "\n" + text + "\n" + RAW_SENTINEL + RAW_CLOSE;
}

std::string strip_raw_markers(const std::string& text) {
    const std::string open = std::string(RAW_OPEN) + RAW_SENTINEL + "\n";
    const std::string close = std::string("\n") + RAW_SENTINEL + RAW_CLOSE;

    std::string result;
    result.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        size_t at = text.find(open, i);
        if (at == std::string::npos) break;
        size_t body = at + open.size();
        size_t end = text.find(close, body);
        if (end == std::string::npos) break;
        result.append(text, i, at - i);
        result.append(text, body, end - body);
        i = end + close.size();
    }
    result.append(text, i, std::string::npos);
    return result;
}

} // namespace mdexpand

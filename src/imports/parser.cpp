#include "mdexpand/parser.hpp"
#include "mdexpand/scanner.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace mdexpand {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// End of the whitespace-free run starting at pos
size_t token_end(const std::string& text, size_t pos) {
    while (pos < text.size() && !is_space(text[pos])) {
        ++pos;
    }
    return pos;
}

bool is_digits(const std::string& s, size_t begin, size_t end) {
    if (begin >= end) return false;
    for (size_t i = begin; i < end; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

// @./path, @~/path, @/abs - runs until whitespace. Returns the end of the
// directive, or npos when pos does not start one.
size_t match_file_import_at(const std::string& text, size_t pos) {
    size_t p = pos + 1;
    if (p < text.size() && text[p] == '~' && p + 1 < text.size() &&
        (text[p + 1] == '.' || text[p + 1] == '/')) {
        p += 2;
    } else if (p < text.size() && (text[p] == '.' || text[p] == '/')) {
        p += 1;
    } else {
        return std::string::npos;
    }
    size_t end = token_end(text, p);
    return end > p ? end : std::string::npos;
}

// Requires the scheme so that emails never match
size_t match_url_import_at(const std::string& text, size_t pos) {
    size_t p = pos + 1;
    if (text.compare(p, 7, "http://") == 0) {
        p += 7;
    } else if (text.compare(p, 8, "https://") == 0) {
        p += 8;
    } else {
        return std::string::npos;
    }
    size_t end = token_end(text, p);
    return end > p ? end : std::string::npos;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

ImportAction classify_file_import(const std::string& full_match,
                                  const std::string& path,
                                  size_t index) {
    if (is_glob_pattern(path)) {
        GlobImport glob;
        glob.pattern = path;
        glob.original_text = full_match;
        glob.source_index = index;
        return glob;
    }

    SymbolSpec sym = parse_symbol_extraction(path);
    if (sym.symbol) {
        SymbolImport symbol;
        symbol.path = sym.path;
        symbol.symbol = *sym.symbol;
        symbol.original_text = full_match;
        symbol.source_index = index;
        return symbol;
    }

    FileImport file;
    LineRangeSpec lr = parse_line_range(path);
    file.path = lr.path;
    file.line_range = lr.range;
    file.original_text = full_match;
    file.source_index = index;
    return file;
}

// !`cmd` with a variable-length delimiter. Tries the longest opening run first,
// then shorter ones, and takes the first closing run after at least one char.
std::optional<CommandImport> match_command_at(const std::string& text, size_t pos) {
    if (pos + 1 >= text.size() || text[pos] != '!' || text[pos + 1] != '`') {
        return std::nullopt;
    }

    size_t run = 0;
    while (pos + 1 + run < text.size() && text[pos + 1 + run] == '`') {
        ++run;
    }

    for (size_t n = run; n >= 1; --n) {
        size_t content_start = pos + 1 + n;
        if (content_start + 1 > text.size()) continue;
        std::string delim(n, '`');
        size_t close = text.find(delim, content_start + 1);
        if (close == std::string::npos) continue;

        CommandImport cmd;
        cmd.command = text.substr(content_start, close - content_start);
        cmd.original_text = text.substr(pos, close + n - pos);
        cmd.source_index = pos;
        return cmd;
    }

    return std::nullopt;
}

// ```lang\n#!shebang\ncode``` starting exactly at pos
std::optional<ExecutableCodeFence> match_fence_at(const std::string& text, size_t pos) {
    size_t run = 0;
    while (pos + run < text.size() && text[pos + run] == '`') {
        ++run;
    }
    if (run < 3) return std::nullopt;

    for (size_t n = run; n >= 3; --n) {
        size_t info_start = pos + n;
        size_t info_end = text.find('\n', info_start);
        if (info_end == std::string::npos) return std::nullopt;

        size_t shebang_start = info_end + 1;
        if (text.compare(shebang_start, 2, "#!") != 0) continue;
        size_t shebang_end = text.find('\n', shebang_start);
        if (shebang_end == std::string::npos) continue;

        size_t code_start = shebang_end + 1;
        size_t close = text.find(std::string(n, '`'), code_start);
        if (close == std::string::npos) continue;

        std::string info = trim(text.substr(info_start, info_end - info_start));
        std::string language = info.substr(0, info.find_first_of(" \t"));

        ExecutableCodeFence fence;
        fence.shebang = text.substr(shebang_start, shebang_end - shebang_start);
        fence.language = language.empty() ? "txt" : language;
        fence.code = trim(text.substr(code_start, close - code_start));
        fence.original_text = text.substr(pos, close + n - pos);
        fence.source_index = pos;
        return fence;
    }

    return std::nullopt;
}

} // namespace

bool is_glob_pattern(const std::string& path) {
    return path.find_first_of("*?[") != std::string::npos;
}

LineRangeSpec parse_line_range(const std::string& path) {
    LineRangeSpec spec;
    spec.path = path;

    size_t colon = path.rfind(':');
    if (colon == std::string::npos || colon == 0) return spec;
    size_t dash = path.find('-', colon + 1);
    if (dash == std::string::npos || !is_digits(path, colon + 1, dash) ||
        !is_digits(path, dash + 1, path.size())) {
        return spec;
    }

    try {
        LineRange range;
        range.start = std::stoi(path.substr(colon + 1, dash - colon - 1));
        range.end = std::stoi(path.substr(dash + 1));
        spec.path = path.substr(0, colon);
        spec.range = range;
    } catch (const std::out_of_range&) {
        // Numbers too large to be line numbers; treat as a plain path
    }
    return spec;
}

SymbolSpec parse_symbol_extraction(const std::string& path) {
    SymbolSpec spec;
    spec.path = path;

    size_t hash = path.rfind('#');
    if (hash == std::string::npos || hash == 0 || hash + 1 >= path.size() ||
        !is_identifier_start(path[hash + 1])) {
        return spec;
    }
    for (size_t i = hash + 2; i < path.size(); ++i) {
        if (!is_identifier_char(path[i])) return spec;
    }

    spec.path = path.substr(0, hash);
    spec.symbol = path.substr(hash + 1);
    return spec;
}

std::vector<ImportAction> parse_imports(const std::string& text) {
    std::vector<ImportAction> actions;

    std::vector<SafeRange> safe_ranges = find_safe_ranges(text);
    std::set<size_t> unsafe_starts = find_unsafe_block_starts(text, safe_ranges);

    // File and URL directives are separate passes; each resumes after its own match
    for (size_t at = text.find('@'); at != std::string::npos;) {
        size_t end = match_file_import_at(text, at);
        if (end == std::string::npos) {
            at = text.find('@', at + 1);
            continue;
        }
        if (is_in_safe_range(at, safe_ranges)) {
            std::string full = text.substr(at, end - at);
            actions.push_back(classify_file_import(full, full.substr(1), at));
        }
        at = text.find('@', end);
    }

    for (size_t at = text.find('@'); at != std::string::npos;) {
        size_t end = match_url_import_at(text, at);
        if (end == std::string::npos) {
            at = text.find('@', at + 1);
            continue;
        }
        if (is_in_safe_range(at, safe_ranges)) {
            UrlImport url;
            url.original_text = text.substr(at, end - at);
            url.url = url.original_text.substr(1);
            url.source_index = at;
            actions.push_back(std::move(url));
        }
        at = text.find('@', end);
    }

    size_t pos = 0;
    while (pos < text.size()) {
        auto cmd = match_command_at(text, pos);
        if (!cmd) {
            ++pos;
            continue;
        }
        pos = cmd->source_index + cmd->original_text.size();
        if (is_in_safe_range(cmd->source_index, safe_ranges)) {
            actions.push_back(std::move(*cmd));
        }
    }

    for (size_t start : unsafe_starts) {
        auto fence = match_fence_at(text, start);
        if (fence) {
            actions.push_back(std::move(*fence));
        }
    }

    std::stable_sort(actions.begin(), actions.end(),
                     [](const ImportAction& a, const ImportAction& b) {
                         return source_index(a) < source_index(b);
                     });

    return actions;
}

bool has_imports(const std::string& text) {
    return !parse_imports(text).empty();
}

bool has_content_imports(const std::string& text) {
    auto actions = parse_imports(text);
    return std::any_of(actions.begin(), actions.end(), is_content_action);
}

bool has_command_imports(const std::string& text) {
    auto actions = parse_imports(text);
    return std::any_of(actions.begin(), actions.end(), is_command_action);
}

} // namespace mdexpand

#include "mdexpand/glob.hpp"

#include <filesystem>
#include <set>

namespace mdexpand {

namespace fs = std::filesystem;

namespace {

std::vector<std::string> split_segments(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        if (slash > start) {
            std::string seg = path.substr(start, slash - start);
            if (seg != ".") segments.push_back(seg);
        }
        start = slash + 1;
    }
    return segments;
}

bool has_magic(const std::string& s) {
    return s.find_first_of("*?[") != std::string::npos;
}

std::string strip_dot_slash(std::string pattern) {
    while (pattern.rfind("./", 0) == 0) {
        pattern.erase(0, 2);
    }
    return pattern;
}

// [abc], [a-z], [!x], [^x] starting at p[pi] == '['. Advances pi past ']'.
// A class without a closing bracket is treated as a literal '['.
bool match_class(const std::string& p, size_t& pi, char c, bool& valid) {
    size_t i = pi + 1;
    bool negate = false;
    if (i < p.size() && (p[i] == '!' || p[i] == '^')) {
        negate = true;
        ++i;
    }

    bool matched = false;
    bool first = true;
    while (i < p.size() && (first || p[i] != ']')) {
        first = false;
        char lo = p[i];
        if (i + 2 < p.size() && p[i + 1] == '-' && p[i + 2] != ']') {
            char hi = p[i + 2];
            if (c >= lo && c <= hi) matched = true;
            i += 3;
        } else {
            if (c == lo) matched = true;
            ++i;
        }
    }

    if (i >= p.size()) {
        valid = false;
        return false;
    }
    valid = true;
    pi = i + 1;
    return matched != negate;
}

bool match_segment_at(const std::string& p, size_t pi, const std::string& s, size_t si) {
    while (pi < p.size()) {
        char pc = p[pi];
        if (pc == '*') {
            while (pi < p.size() && p[pi] == '*') ++pi;
            if (pi == p.size()) return true;
            for (size_t k = si; k <= s.size(); ++k) {
                if (match_segment_at(p, pi, s, k)) return true;
            }
            return false;
        }
        if (si >= s.size()) return false;
        if (pc == '?') {
            ++pi;
            ++si;
            continue;
        }
        if (pc == '[') {
            bool valid = false;
            size_t next = pi;
            bool m = match_class(p, next, s[si], valid);
            if (valid) {
                if (!m) return false;
                pi = next;
                ++si;
                continue;
            }
        }
        if (pc == '\\' && pi + 1 < p.size()) {
            ++pi;
            pc = p[pi];
        }
        if (pc != s[si]) return false;
        ++pi;
        ++si;
    }
    return si == s.size();
}

bool match_segment(const std::string& pattern, const std::string& name, bool dot) {
    if (!dot && !name.empty() && name[0] == '.' && (pattern.empty() || pattern[0] != '.')) {
        return false;
    }
    return match_segment_at(pattern, 0, name, 0);
}

bool match_segments(const std::vector<std::string>& pat, size_t pi,
                    const std::vector<std::string>& path, size_t si, bool dot) {
    if (pi == pat.size()) {
        return si == path.size();
    }

    if (pat[pi] == "**") {
        for (size_t k = si; k <= path.size(); ++k) {
            if (k > si && !dot && !path[k - 1].empty() && path[k - 1][0] == '.') {
                break;
            }
            if (match_segments(pat, pi + 1, path, k, dot)) return true;
        }
        return false;
    }

    if (si == path.size()) return false;
    if (!match_segment(pat[pi], path[si], dot)) return false;
    return match_segments(pat, pi + 1, path, si + 1, dot);
}

bool match_path(const std::string& pattern, const std::string& path, bool dot) {
    return match_segments(split_segments(pattern), 0, split_segments(path), 0, dot);
}

void expand_one(const std::string& pattern, const std::string& base_dir,
                std::set<std::string>& out) {
    std::string pat = strip_dot_slash(pattern);
    fs::path root;
    if (!pat.empty() && pat[0] == '/') {
        root = "/";
        pat = pat.substr(1);
    } else {
        std::error_code ec;
        root = fs::absolute(base_dir, ec);
        if (ec) root = base_dir;
    }

    auto segments = split_segments(pat);
    if (segments.empty()) return;

    // Literal leading segments select the directory to walk
    size_t literal = 0;
    while (literal < segments.size() && !has_magic(segments[literal])) {
        root /= segments[literal];
        ++literal;
    }

    std::error_code ec;
    if (literal == segments.size()) {
        if (fs::is_regular_file(root, ec)) {
            out.insert(root.lexically_normal().string());
        }
        return;
    }

    if (!fs::is_directory(root, ec)) return;

    std::vector<std::string> rest(segments.begin() + static_cast<std::ptrdiff_t>(literal),
                                  segments.end());
    bool recursive = false;
    bool wants_hidden = false;
    for (const auto& seg : rest) {
        if (seg == "**") recursive = true;
        if (!seg.empty() && seg[0] == '.') wants_hidden = true;
    }
    int max_depth = static_cast<int>(rest.size()) - 1;

    auto options = fs::directory_options::skip_permission_denied;
    for (fs::recursive_directory_iterator it(root, options, ec), end; !ec && it != end;
         it.increment(ec)) {
        const auto& entry = *it;
        std::string name = entry.path().filename().string();
        std::error_code entry_ec;

        if (entry.is_directory(entry_ec)) {
            bool hidden = !name.empty() && name[0] == '.';
            if ((hidden && !wants_hidden) || (!recursive && it.depth() >= max_depth) ||
                entry.is_symlink(entry_ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }

        if (!entry.is_regular_file(entry_ec)) continue;

        std::string rel = entry.path().lexically_relative(root).generic_string();
        if (match_segments(rest, 0, split_segments(rel), 0, false)) {
            out.insert(entry.path().lexically_normal().string());
        }
    }
}

} // namespace

std::vector<std::string> expand_braces(const std::string& pattern) {
    size_t open = pattern.find('{');
    if (open == std::string::npos) return {pattern};
    size_t close = pattern.find('}', open);
    if (close == std::string::npos) return {pattern};

    std::string prefix = pattern.substr(0, open);
    std::string body = pattern.substr(open + 1, close - open - 1);
    std::string suffix = pattern.substr(close + 1);

    std::vector<std::string> result;
    size_t start = 0;
    while (true) {
        size_t comma = body.find(',', start);
        std::string alt = body.substr(start, comma == std::string::npos ? std::string::npos
                                                                        : comma - start);
        for (auto& tail : expand_braces(suffix)) {
            result.push_back(prefix + alt + tail);
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return result;
}

bool glob_match(const std::string& pattern, const std::string& path) {
    std::string p = strip_dot_slash(path);
    for (const auto& alt : expand_braces(pattern)) {
        if (match_path(strip_dot_slash(alt), p, false)) return true;
    }
    return false;
}

std::vector<std::string> expand_glob(const std::string& pattern, const std::string& base_dir) {
    std::set<std::string> found;
    for (const auto& alt : expand_braces(pattern)) {
        expand_one(alt, base_dir, found);
    }
    return std::vector<std::string>(found.begin(), found.end());
}

// ============================================================================
// IgnoreRules
// ============================================================================

IgnoreRules IgnoreRules::with_defaults() {
    IgnoreRules rules;
    rules.add(".git");
    rules.add("node_modules");
    rules.add(".DS_Store");
    rules.add("*.log");
    return rules;
}

void IgnoreRules::add(const std::string& line) {
    std::string pattern = line;
    while (!pattern.empty() && (pattern.back() == ' ' || pattern.back() == '\r' ||
                                pattern.back() == '\t')) {
        if (pattern.size() >= 2 && pattern[pattern.size() - 2] == '\\') break;
        pattern.pop_back();
    }
    if (pattern.empty() || pattern[0] == '#') return;

    Rule rule;
    if (pattern[0] == '!') {
        rule.negated = true;
        pattern.erase(0, 1);
    } else if (pattern.rfind("\\!", 0) == 0 || pattern.rfind("\\#", 0) == 0) {
        pattern.erase(0, 1);
    }

    if (!pattern.empty() && pattern.back() == '/') {
        rule.directory_only = true;
        pattern.pop_back();
    }
    if (!pattern.empty() && pattern[0] == '/') {
        rule.anchored = true;
        pattern.erase(0, 1);
    } else if (pattern.find('/') != std::string::npos) {
        rule.anchored = true;
    }
    if (pattern.empty()) return;

    rule.pattern = pattern;
    rules_.push_back(std::move(rule));
}

void IgnoreRules::add_lines(const std::string& content) {
    size_t start = 0;
    while (start <= content.size()) {
        size_t nl = content.find('\n', start);
        if (nl == std::string::npos) nl = content.size();
        std::string line = content.substr(start, nl - start);
        if (line.find_first_not_of(" \t\r") != std::string::npos && line[0] != '#') {
            add(line);
        }
        start = nl + 1;
    }
}

bool IgnoreRules::rule_matches(const Rule& rule, const std::string& path, bool is_dir) const {
    if (rule.directory_only && !is_dir) return false;
    if (rule.anchored) {
        return match_path(rule.pattern, path, true);
    }
    size_t slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return match_segment(rule.pattern, name, true);
}

bool IgnoreRules::ignores(const std::string& relative_path) const {
    auto segments = split_segments(strip_dot_slash(relative_path));
    std::string prefix;

    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) prefix += '/';
        prefix += segments[i];
        bool is_dir = i + 1 < segments.size();

        bool ignored = false;
        for (const auto& rule : rules_) {
            if (rule_matches(rule, prefix, is_dir)) {
                ignored = !rule.negated;
            }
        }

        // Nothing below an ignored directory can be re-included
        if (ignored) return true;
    }
    return false;
}

} // namespace mdexpand

#pragma once

#include <string>
#include <vector>

namespace mdexpand {

// ============================================================================
// Glob Matching
// ============================================================================

// Expand non-nested {a,b} alternatives; a pattern without braces maps to itself
std::vector<std::string> expand_braces(const std::string& pattern);

/**
 * Match a '/'-separated relative path against a glob pattern.
 *
 * Supports *, ?, [abc], [a-z], [!x] within a segment and ** across segments.
 * Wildcards never match a leading '.' in a segment; spell the dot explicitly
 * to match hidden files.
 */
bool glob_match(const std::string& pattern, const std::string& path);

// Regular files under base_dir whose relative path matches pattern.
// Returned as absolute paths, unsorted.
std::vector<std::string> expand_glob(const std::string& pattern, const std::string& base_dir);

// ============================================================================
// Ignore Rules (.gitignore subset)
// ============================================================================

class IgnoreRules {
public:
    // .git, node_modules, .DS_Store and *.log
    static IgnoreRules with_defaults();

    void add(const std::string& pattern);

    // Add the lines of a .gitignore file; blank lines and comments are skipped
    void add_lines(const std::string& content);

    // path is relative to the directory the rules were collected for
    bool ignores(const std::string& relative_path) const;

    size_t size() const { return rules_.size(); }

private:
    struct Rule {
        std::string pattern;
        bool negated = false;
        bool directory_only = false;
        bool anchored = false;  // contains a '/' before its last char
    };

    std::vector<Rule> rules_;

    bool rule_matches(const Rule& rule, const std::string& path, bool is_dir) const;
};

} // namespace mdexpand

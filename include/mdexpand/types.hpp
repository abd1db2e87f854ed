#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mdexpand {

// ============================================================================
// Scanner Types
// ============================================================================

enum class ScanContext {
    Normal,
    FencedCode,
    InlineCode
};

// Half-open [start, end) byte range where directives may be recognized
struct SafeRange {
    size_t start = 0;
    size_t end = 0;

    bool operator==(const SafeRange& other) const {
        return start == other.start && end == other.end;
    }
};

// ============================================================================
// Import Actions
// ============================================================================

enum class ActionType {
    File,
    Glob,
    Url,
    Command,
    Symbol,
    ExecutableCodeFence
};

inline const char* action_type_to_string(ActionType t) {
    switch (t) {
        case ActionType::File: return "file";
        case ActionType::Glob: return "glob";
        case ActionType::Url: return "url";
        case ActionType::Command: return "command";
        case ActionType::Symbol: return "symbol";
        case ActionType::ExecutableCodeFence: return "executable_code_fence";
        default: return "unknown";
    }
}

struct LineRange {
    int start = 0;
    int end = 0;
};

// @./path, @~/path, @/abs/path, optionally with :start-end
struct FileImport {
    std::string path;
    std::optional<LineRange> line_range;
    std::string original_text;
    size_t source_index = 0;
};

// @./file.ts#Symbol
struct SymbolImport {
    std::string path;
    std::string symbol;
    std::string original_text;
    size_t source_index = 0;
};

// @./src/**/*.ts
struct GlobImport {
    std::string pattern;
    std::string original_text;
    size_t source_index = 0;
};

// @https://example.com/doc.md
struct UrlImport {
    std::string url;
    std::string original_text;
    size_t source_index = 0;
};

// !`command`
struct CommandImport {
    std::string command;
    std::string original_text;
    size_t source_index = 0;
};

// ```lang
// #!/usr/bin/env interpreter
// code
// ```
struct ExecutableCodeFence {
    std::string shebang;
    std::string language;
    std::string code;
    std::string original_text;
    size_t source_index = 0;
};

using ImportAction = std::variant<
    FileImport,
    SymbolImport,
    GlobImport,
    UrlImport,
    CommandImport,
    ExecutableCodeFence>;

ActionType action_type(const ImportAction& action);
const std::string& original_text(const ImportAction& action);
size_t source_index(const ImportAction& action);

inline bool is_content_action(const ImportAction& action) {
    auto t = action_type(action);
    return t == ActionType::File || t == ActionType::Glob ||
           t == ActionType::Url || t == ActionType::Symbol;
}

inline bool is_command_action(const ImportAction& action) {
    auto t = action_type(action);
    return t == ActionType::Command || t == ActionType::ExecutableCodeFence;
}

// ============================================================================
// Resolved Import
// ============================================================================

struct ResolvedImport {
    ImportAction action;
    std::string content;
};

// ============================================================================
// Warning System
// ============================================================================

enum class Warning {
    glob_binary_skipped,
    high_token_count,
    invalid_configuration,
};

inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::glob_binary_skipped: return "glob_binary_skipped";
        case Warning::high_token_count: return "high_token_count";
        case Warning::invalid_configuration: return "invalid_configuration";
        default: return "unknown";
    }
}

std::optional<Warning> parse_warning_key(const std::string& key);

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

} // namespace mdexpand

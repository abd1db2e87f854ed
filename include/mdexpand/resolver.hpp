#pragma once

#include "mdexpand/config.hpp"
#include "mdexpand/environment.hpp"
#include "mdexpand/error.hpp"
#include "mdexpand/glob.hpp"
#include "mdexpand/import_stack.hpp"
#include "mdexpand/types.hpp"
#include "mdexpand/warnings.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mdexpand {

// ============================================================================
// Resolution Context
// ============================================================================

// Records what was pulled in, in completion order. Shared across threads.
class ImportAccumulator {
public:
    void record(const std::string& entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(entry);
    }

    std::vector<std::string> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> entries_;
};

struct ResolutionContext {
    // Environment for spawned commands; empty inherits the process environment
    std::unordered_map<std::string, std::string> env;

    ImportAccumulator* imported = nullptr;

    // Working directory for commands; empty falls back to the importing file's dir
    std::string invocation_cwd;

    // Interpolated into command text before execution
    std::unordered_map<std::string, std::string> template_vars;

    bool dry_run = false;

    // Recursion skips commands and code fences
    bool content_only = false;

    Config config;

    WarningCollector* warnings = nullptr;

    // Null selects the host environment without a remote cache
    SystemEnvironment* system = nullptr;
};

// ============================================================================
// Resolver
// ============================================================================

/**
 * Turns one ImportAction into replacement text.
 *
 * File imports recurse into the imported content with the stack extended by
 * the file's canonical path. Every failure is returned as an Error; nothing
 * is thrown.
 */
class Resolver {
public:
    explicit Resolver(const ResolutionContext& ctx);

    Result<std::string> resolve(const ImportAction& action,
                                const std::string& current_dir,
                                const ImportStack& stack) const;

private:
    const ResolutionContext& ctx_;
    SystemEnvironment& system_;

    Result<std::string> resolve_file(const FileImport& action,
                                     const std::string& current_dir,
                                     const ImportStack& stack) const;
    Result<std::string> resolve_line_range(const FileImport& action,
                                           const std::string& current_dir) const;
    Result<std::string> resolve_symbol(const SymbolImport& action,
                                       const std::string& current_dir) const;
    Result<std::string> resolve_glob(const GlobImport& action,
                                     const std::string& current_dir) const;
    Result<std::string> resolve_url(const UrlImport& action) const;
    Result<std::string> resolve_command(const CommandImport& action,
                                        const std::string& current_dir) const;
    Result<std::string> resolve_code_fence(const ExecutableCodeFence& action,
                                           const std::string& current_dir) const;

    // Existence, size and binary checks shared by the file-like imports
    Result<void> check_importable(const std::string& import_path,
                                  const std::string& resolved_path) const;
    Result<void> check_size(const std::string& resolved_path) const;
    bool is_binary(const std::string& resolved_path) const;

    // Defaults plus every .gitignore from current_dir up to the repository root
    IgnoreRules load_ignore_rules(const std::string& current_dir) const;

    std::string command_cwd(const std::string& current_dir) const;
    void record(const std::string& entry) const;
};

// "~" expansion, then relative paths joined onto base_dir
std::string resolve_import_path(const std::string& path, const std::string& base_dir);

// Tag name for a file in a glob import: "my-file" for "My File.ts"
std::string glob_tag_name(const std::string& path);

// Executable extension for a code fence language
std::string code_fence_extension(const std::string& language);

// True when the first word of the command is a markdown file path
bool is_markdown_file_command(const std::string& command);

} // namespace mdexpand

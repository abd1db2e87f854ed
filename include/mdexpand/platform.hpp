#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace mdexpand {

// ============================================================================
// Path Utilities
// ============================================================================

std::string get_parent_directory(const std::string& path);
std::string get_filename(const std::string& path);
std::string join_path(const std::string& base, const std::string& rel);
bool path_exists(const std::string& path);
bool is_regular_file(const std::string& path);
bool is_directory(const std::string& path);

// Absolute, symlink-resolved form of an existing path; nullopt on failure
std::optional<std::string> canonical_path(const std::string& path);

std::string current_directory();

// $HOME (or %USERPROFILE%); empty if unset
std::string home_directory();

// "~" and "~/x" expand to the home directory. "~user" is left alone.
std::string expand_tilde(const std::string& path);

// ============================================================================
// File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

bool create_directories(const std::string& path);
bool remove_file(const std::string& path);

// <tmpdir>/<prefix><random hex>.<ext>
std::string make_temp_path(const std::string& prefix, const std::string& ext);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);
std::unordered_map<std::string, std::string> get_all_env();

// Milliseconds since the Unix epoch
int64_t now_millis();

// RFC3339 UTC string for a millisecond timestamp
std::string format_timestamp(int64_t epoch_ms);

} // namespace mdexpand

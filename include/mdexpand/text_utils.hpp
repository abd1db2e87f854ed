#pragma once

#include <cstddef>
#include <string>

namespace mdexpand {

// ============================================================================
// Text Utilities
// ============================================================================

std::string trim(const std::string& s);

// Remove ANSI/VT100 escape sequences (ESC or CSI introduced)
std::string strip_ansi(const std::string& s);

// Cut to max_chars and append "\n... [Output truncated: N characters removed]"
std::string truncate_output(const std::string& s, size_t max_chars);

// True if a NUL byte occurs within the first `limit` bytes
bool contains_null_byte(const std::string& data, size_t limit);

// ============================================================================
// Binary Detection
// ============================================================================

constexpr size_t BINARY_CHECK_SIZE = 8192;
constexpr size_t COMMAND_BINARY_CHECK_SIZE = 1024;

// Fast path: extension (case-insensitive) or a well-known binary basename
bool has_binary_extension(const std::string& path);

} // namespace mdexpand

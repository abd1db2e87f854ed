#pragma once

#include "mdexpand/types.hpp"

#include <set>
#include <string>
#include <vector>

namespace mdexpand {

// ============================================================================
// Directive Scanner
// ============================================================================

// Scan text once and return the ranges that lie outside fenced code blocks
// (``` or ~~~, 3+ chars) and inline code spans (single backtick).
// - A fence closes on a line-start run of the same char at least as long
// - Inline code ends at the next backtick or newline
// - An unterminated fence makes the rest of the text unsafe
// - Text with no code yields one range covering the input
std::vector<SafeRange> find_safe_ranges(const std::string& text);

// Offsets where an unsafe (code) block begins. Executable fences are only
// recognized when they start exactly at one of these offsets.
std::set<size_t> find_unsafe_block_starts(const std::string& text,
                                          const std::vector<SafeRange>& safe_ranges);

bool is_in_safe_range(size_t index, const std::vector<SafeRange>& safe_ranges);

} // namespace mdexpand

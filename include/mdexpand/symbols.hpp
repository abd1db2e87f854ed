#pragma once

#include "mdexpand/error.hpp"

#include <string>

namespace mdexpand {

// ============================================================================
// Partial File Extraction
// ============================================================================

// Lines start..end (1-indexed, inclusive) joined by '\n'.
// Out-of-range bounds are clamped; an empty selection yields "".
std::string extract_lines(const std::string& content, int start, int end);

/**
 * Extract the declaration of a TypeScript/JavaScript symbol.
 *
 * Recognizes interface, type, function, class, const/let/var and enum
 * declarations (optionally exported). The declaration runs from its first
 * line until brace and paren depth return to zero outside string literals.
 * An unterminated declaration extends to end of file.
 *
 * Fails with SYMBOL_NOT_FOUND when no declaration matches.
 */
Result<std::string> extract_symbol(const std::string& content, const std::string& symbol);

} // namespace mdexpand

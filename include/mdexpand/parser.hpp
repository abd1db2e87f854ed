#pragma once

#include "mdexpand/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mdexpand {

// ============================================================================
// Action Parser
// ============================================================================

// Find every directive outside code and classify it.
// Results are sorted by source_index ascending. Pure; never fails.
std::vector<ImportAction> parse_imports(const std::string& text);

// True if the path contains glob metacharacters (*, ? or [)
bool is_glob_pattern(const std::string& path);

struct LineRangeSpec {
    std::string path;
    std::optional<LineRange> range;
};

// Split "file.ts:10-50" into path and range
LineRangeSpec parse_line_range(const std::string& path);

struct SymbolSpec {
    std::string path;
    std::optional<std::string> symbol;
};

// Split "file.ts#Name" into path and symbol
SymbolSpec parse_symbol_extraction(const std::string& path);

bool has_imports(const std::string& text);
bool has_content_imports(const std::string& text);
bool has_command_imports(const std::string& text);

} // namespace mdexpand

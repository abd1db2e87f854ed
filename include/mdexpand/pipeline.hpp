#pragma once

#include "mdexpand/error.hpp"
#include "mdexpand/import_stack.hpp"
#include "mdexpand/resolver.hpp"

#include <functional>
#include <string>

namespace mdexpand {

// ============================================================================
// Expansion Pipeline
// ============================================================================
//
// Each entry parses the text, resolves the selected actions concurrently
// (at most config.concurrency_limit at a time) and splices the results back
// by source position. The first failure aborts the call; actions that have
// not started by then are skipped.
//
// A text with no matching actions is returned unchanged.

// Every action kind
Result<std::string> expand_imports(const std::string& text,
                                   const std::string& current_dir,
                                   const ImportStack& stack,
                                   const ResolutionContext& ctx);

// Files, globs, URLs and symbols. Recursion into imported files stays
// content-only so commands are left for the final phase.
Result<std::string> expand_content_imports(const std::string& text,
                                           const std::string& current_dir,
                                           const ImportStack& stack,
                                           const ResolutionContext& ctx);

// Commands and executable code fences
Result<std::string> expand_command_imports(const std::string& text,
                                           const std::string& current_dir,
                                           const ResolutionContext& ctx);

} // namespace mdexpand

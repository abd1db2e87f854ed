#pragma once

#include "mdexpand/types.hpp"

#include <string>
#include <vector>

namespace mdexpand {

// Replace each action's original text with its resolved content.
// Splices run in descending source_index order so earlier offsets stay valid.
std::string inject_imports(const std::string& text, std::vector<ResolvedImport> resolved);

} // namespace mdexpand

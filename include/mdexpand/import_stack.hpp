#pragma once

#include <string>
#include <vector>

namespace mdexpand {

// ============================================================================
// Import Stack (cycle guard)
// ============================================================================

/**
 * Canonical paths currently being expanded on one recursion branch.
 *
 * Never mutated in place: extended() returns a copy, so sibling branches
 * resolving concurrently do not see each other's entries.
 */
class ImportStack {
public:
    ImportStack() = default;

    bool contains(const std::string& canonical_path) const;

    ImportStack extended(const std::string& canonical_path) const;

    // "a -> b -> c -> <closing>" for error reporting
    std::string chain_to(const std::string& closing_path) const;

    size_t size() const { return paths_.size(); }
    bool empty() const { return paths_.empty(); }

private:
    std::vector<std::string> paths_;
};

} // namespace mdexpand

#include "mdexpand/import_stack.hpp"

#include <algorithm>

namespace mdexpand {

bool ImportStack::contains(const std::string& canonical_path) const {
    return std::find(paths_.begin(), paths_.end(), canonical_path) != paths_.end();
}

ImportStack ImportStack::extended(const std::string& canonical_path) const {
    ImportStack next = *this;
    next.paths_.push_back(canonical_path);
    return next;
}

std::string ImportStack::chain_to(const std::string& closing_path) const {
    std::string chain;
    for (const auto& p : paths_) {
        chain += p;
        chain += " -> ";
    }
    chain += closing_path;
    return chain;
}

} // namespace mdexpand

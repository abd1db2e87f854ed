#include "mdexpand/injector.hpp"

#include <algorithm>

namespace mdexpand {

std::string inject_imports(const std::string& text, std::vector<ResolvedImport> resolved) {
    std::sort(resolved.begin(), resolved.end(),
              [](const ResolvedImport& a, const ResolvedImport& b) {
                  return source_index(a.action) > source_index(b.action);
              });

    std::string result = text;
    for (const auto& r : resolved) {
        size_t index = source_index(r.action);
        size_t len = original_text(r.action).size();
        result.replace(index, len, r.content);
    }
    return result;
}

} // namespace mdexpand

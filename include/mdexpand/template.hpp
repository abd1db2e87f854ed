#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace mdexpand {

// ============================================================================
// Template Substitution
// ============================================================================

constexpr const char* RAW_OPEN = "{% raw %}";
constexpr const char* RAW_CLOSE = "{% endraw %}";

// Tags the markers wrap_raw adds. It sits inside the raw block, so a template
// pass copies it through with the wrapped text.
constexpr const char* RAW_SENTINEL = "<!--mdexpand-->";

// Replace {{ name }} with vars[name]. Unknown names are left as written.
// {% raw %}...{% endraw %} blocks, markers included, are copied untouched so
// that running the pass twice gives the same text.
std::string substitute(const std::string& text,
                       const std::unordered_map<std::string, std::string>& vars);

// Same, reporting each unknown name once in order of appearance
std::string substitute(const std::string& text,
                       const std::unordered_map<std::string, std::string>& vars,
                       std::vector<std::string>& missing);

// "{% raw %}<!--mdexpand-->\n" + text + "\n<!--mdexpand-->{% endraw %}"
std::string wrap_raw(const std::string& text);

// Remove the markers wrap_raw added, with their newlines. Raw blocks written
// by the document's author are kept.
std::string strip_raw_markers(const std::string& text);

} // namespace mdexpand

#include "mdexpand/content_type.hpp"
#include "mdexpand/text_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include <nlohmann/json.hpp>

namespace mdexpand {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& s, char c) {
    return !s.empty() && s.front() == c;
}

} // namespace

bool is_allowed_content_type(const std::string& content_type) {
    static const std::array<const char*, 6> allowed = {
        "text/markdown",
        "text/x-markdown",
        "text/plain",
        "application/json",
        "application/x-json",
        "text/json",
    };

    std::string base = to_lower(trim(content_type.substr(0, content_type.find(';'))));
    if (base.empty()) return false;

    return std::any_of(allowed.begin(), allowed.end(),
                       [&base](const char* a) { return base == a; });
}

ContentKind infer_content_kind(const std::string& body, const std::string& url) {
    std::string trimmed = trim(body);

    bool object_like = starts_with(trimmed, '{') && trimmed.back() == '}';
    bool array_like = starts_with(trimmed, '[') && trimmed.back() == ']';
    if ((object_like || array_like) && nlohmann::json::accept(trimmed)) {
        return ContentKind::Json;
    }

    std::string url_lower = to_lower(url);
    if (ends_with(url_lower, ".md") || ends_with(url_lower, ".markdown")) {
        return ContentKind::Markdown;
    }
    if (ends_with(url_lower, ".json")) {
        return ContentKind::Json;
    }

    if (starts_with(trimmed, '#') ||
        trimmed.find("\n#") != std::string::npos ||
        trimmed.find("\n- ") != std::string::npos ||
        trimmed.find("\n* ") != std::string::npos ||
        trimmed.find("```") != std::string::npos) {
        return ContentKind::Markdown;
    }

    return ContentKind::Unknown;
}

} // namespace mdexpand

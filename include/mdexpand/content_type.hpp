#pragma once

#include <string>

namespace mdexpand {

// ============================================================================
// URL Content Types
// ============================================================================

enum class ContentKind {
    Markdown,
    Json,
    Unknown
};

inline const char* content_kind_to_string(ContentKind k) {
    switch (k) {
        case ContentKind::Markdown: return "markdown";
        case ContentKind::Json: return "json";
        default: return "unknown";
    }
}

constexpr const char* URL_ACCEPT_HEADER = "text/markdown, application/json, text/plain, */*";

// Markdown, plain text or JSON media types; parameters such as charset are ignored
bool is_allowed_content_type(const std::string& content_type);

// For a missing or generic Content-Type: JSON that parses, then the URL's
// extension, then markdown-looking structure
ContentKind infer_content_kind(const std::string& body, const std::string& url);

} // namespace mdexpand

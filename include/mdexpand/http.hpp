#pragma once

#include <string>
#include <unordered_map>

namespace mdexpand {

// ============================================================================
// HTTP Fetching
// ============================================================================

struct HttpResponse {
    bool ok = false;  // transport succeeded; status may still be non-2xx
    long status = 0;
    std::unordered_map<std::string, std::string> headers;  // lowercase names
    std::string body;
    std::string error;

    std::string header(const std::string& name) const;
};

constexpr const char* USER_AGENT = "mdexpand/1.0";

// GET url with the given request headers. Redirects are followed.
HttpResponse fetch_url(const std::string& url,
                       const std::unordered_map<std::string, std::string>& request_headers = {});

} // namespace mdexpand

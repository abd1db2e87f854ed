#include "mdexpand/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

namespace mdexpand {

namespace {

const std::regex& ansi_pattern() {
    static const std::regex re(
        "(?:\\x1b|\\xc2\\x9b)[\\[()#;?]*(?:[0-9]{1,4}(?:;[0-9]{0,4})*)?[0-9A-ORZcf-nqry=><]");
    return re;
}

const std::set<std::string>& binary_extensions() {
    static const std::set<std::string> exts = {
        // Images
        ".png", ".jpg", ".jpeg", ".gif", ".ico", ".webp", ".bmp", ".svg", ".tiff", ".tif",
        // Executables and libraries
        ".exe", ".dll", ".so", ".dylib", ".bin",
        // Archives
        ".zip", ".tar", ".gz", ".7z", ".rar", ".bz2", ".xz",
        // Documents
        ".pdf", ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx",
        // Databases
        ".sqlite", ".db", ".sqlite3",
        // Data
        ".dat", ".data",
        // System
        ".ds_store",
        // Other
        ".wasm", ".pyc", ".class", ".o", ".a", ".lib",
    };
    return exts;
}

} // namespace

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string strip_ansi(const std::string& s) {
    if (s.find('\x1b') == std::string::npos && s.find("\xc2\x9b") == std::string::npos) {
        return s;
    }
    return std::regex_replace(s, ansi_pattern(), "");
}

std::string truncate_output(const std::string& s, size_t max_chars) {
    if (s.size() <= max_chars) {
        return s;
    }
    size_t removed = s.size() - max_chars;
    return s.substr(0, max_chars) +
           "\n... [Output truncated: " + std::to_string(removed) + " characters removed]";
}

bool contains_null_byte(const std::string& data, size_t limit) {
    size_t n = std::min(limit, data.size());
    return std::find(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(n), '\0') !=
           data.begin() + static_cast<std::ptrdiff_t>(n);
}

bool has_binary_extension(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    std::string base = slash == std::string::npos ? path : path.substr(slash + 1);
    if (base == ".DS_Store") {
        return true;
    }

    size_t dot = base.rfind('.');
    if (dot == std::string::npos) {
        return false;
    }
    std::string ext = base.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return binary_extensions().count(ext) > 0;
}

} // namespace mdexpand

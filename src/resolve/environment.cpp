#include "mdexpand/environment.hpp"
#include "mdexpand/glob.hpp"
#include "mdexpand/platform.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace mdexpand {

namespace fs = std::filesystem;

bool HostEnvironment::file_exists(const std::string& path) {
    return is_regular_file(path);
}

std::optional<uint64_t> HostEnvironment::file_size(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return static_cast<uint64_t>(size);
}

Result<std::string> HostEnvironment::read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<std::string>::err(
            Error(ErrorCode::IO_ERROR, "Failed to open file: " + path, {{"path", path}}));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Result<std::string>::err(
            Error(ErrorCode::IO_ERROR, "Failed to read file: " + path, {{"path", path}}));
    }
    return Result<std::string>::ok(buffer.str());
}

std::string HostEnvironment::read_prefix(const std::string& path, size_t n) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return "";

    std::string buffer(n, '\0');
    file.read(&buffer[0], static_cast<std::streamsize>(n));
    buffer.resize(static_cast<size_t>(file.gcount()));
    return buffer;
}

std::optional<std::string> HostEnvironment::canonical_path(const std::string& path) {
    return mdexpand::canonical_path(path);
}

std::vector<std::string> HostEnvironment::glob_files(const std::string& pattern,
                                                     const std::string& base_dir) {
    return expand_glob(pattern, base_dir);
}

HttpResponse HostEnvironment::fetch(const std::string& url,
                                    const std::unordered_map<std::string, std::string>& headers) {
    return fetch_url(url, headers);
}

ProcessResult HostEnvironment::run_process(const std::vector<std::string>& argv,
                                           const ProcessOptions& options) {
    return mdexpand::run_process(argv, options);
}

} // namespace mdexpand

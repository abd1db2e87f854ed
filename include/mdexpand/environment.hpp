#pragma once

#include "mdexpand/error.hpp"
#include "mdexpand/http.hpp"
#include "mdexpand/process.hpp"
#include "mdexpand/url_cache.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mdexpand {

// ============================================================================
// System Environment
// ============================================================================

/**
 * Everything the resolver needs from the outside world.
 *
 * HostEnvironment talks to the real filesystem, network and process table.
 * Tests substitute fakes to control latency and content.
 */
class SystemEnvironment {
public:
    virtual ~SystemEnvironment() = default;

    virtual bool file_exists(const std::string& path) = 0;
    virtual std::optional<uint64_t> file_size(const std::string& path) = 0;
    virtual Result<std::string> read_file(const std::string& path) = 0;

    // At most n leading bytes; empty on failure
    virtual std::string read_prefix(const std::string& path, size_t n) = 0;

    virtual std::optional<std::string> canonical_path(const std::string& path) = 0;

    // Absolute paths of regular files matching pattern under base_dir
    virtual std::vector<std::string> glob_files(const std::string& pattern,
                                                const std::string& base_dir) = 0;

    virtual HttpResponse fetch(const std::string& url,
                               const std::unordered_map<std::string, std::string>& headers) = 0;

    virtual ProcessResult run_process(const std::vector<std::string>& argv,
                                      const ProcessOptions& options) = 0;

    // May be null when caching is disabled
    virtual RemoteCache* remote_cache() = 0;
};

class HostEnvironment : public SystemEnvironment {
public:
    HostEnvironment() = default;
    explicit HostEnvironment(std::unique_ptr<RemoteCache> cache) : cache_(std::move(cache)) {}

    bool file_exists(const std::string& path) override;
    std::optional<uint64_t> file_size(const std::string& path) override;
    Result<std::string> read_file(const std::string& path) override;
    std::string read_prefix(const std::string& path, size_t n) override;
    std::optional<std::string> canonical_path(const std::string& path) override;
    std::vector<std::string> glob_files(const std::string& pattern,
                                        const std::string& base_dir) override;
    HttpResponse fetch(const std::string& url,
                       const std::unordered_map<std::string, std::string>& headers) override;
    ProcessResult run_process(const std::vector<std::string>& argv,
                              const ProcessOptions& options) override;
    RemoteCache* remote_cache() override { return cache_.get(); }

private:
    std::unique_ptr<RemoteCache> cache_;
};

} // namespace mdexpand

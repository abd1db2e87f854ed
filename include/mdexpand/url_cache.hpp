#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace mdexpand {

// ============================================================================
// Remote Cache
// ============================================================================

struct CacheMetadata {
    std::string url;
    int64_t fetched_at = 0;  // epoch ms
    int64_t ttl_ms = 0;
    std::optional<std::string> etag;
    std::optional<std::string> last_modified;
};

struct CacheLookup {
    bool hit = false;
    bool expired = false;
    std::optional<std::string> content;       // set on hit, and on expired when readable
    std::optional<CacheMetadata> metadata;
};

// Lookup/store seam consumed by URL resolution
class RemoteCache {
public:
    virtual ~RemoteCache() = default;

    virtual CacheLookup lookup(const std::string& url) = 0;

    virtual bool store(const std::string& url,
                       const std::string& content,
                       const CacheMetadata& metadata) = 0;

    // Restart the TTL of an existing entry (after a 304)
    virtual bool refresh(const std::string& url) = 0;
};

struct CacheStats {
    size_t entries = 0;
    uint64_t total_bytes = 0;
    std::optional<int64_t> oldest_fetch;
    std::optional<int64_t> newest_fetch;
};

/**
 * File-backed cache: <dir>/<sha256(url)>.content + <sha256(url)>.meta.json
 *
 * With no_cache set every lookup misses, but fetched content is still stored.
 */
class DiskRemoteCache : public RemoteCache {
public:
    DiskRemoteCache(std::string dir, int64_t ttl_ms, bool no_cache = false);

    CacheLookup lookup(const std::string& url) override;
    bool store(const std::string& url,
               const std::string& content,
               const CacheMetadata& metadata) override;
    bool refresh(const std::string& url) override;

    bool invalidate(const std::string& url);

    // Returns the number of entries removed
    size_t clear_expired();
    size_t clear_all();

    CacheStats stats() const;

    const std::string& dir() const { return dir_; }
    int64_t ttl_ms() const { return ttl_ms_; }

private:
    std::string dir_;
    int64_t ttl_ms_;
    bool no_cache_;

    std::string content_path(const std::string& url) const;
    std::string metadata_path(const std::string& url) const;
};

// ============================================================================
// Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;
};

HashResult compute_sha256(const std::string& data);

} // namespace mdexpand

#include "mdexpand/url_cache.hpp"
#include "mdexpand/platform.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

namespace mdexpand {

namespace fs = std::filesystem;

// ============================================================================
// SHA-256 (OpenSSL EVP)
// ============================================================================

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

} // namespace

HashResult compute_sha256(const std::string& data) {
    HashResult result;

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }

    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        result.error = "EVP_DigestUpdate failed";
        return result;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }

    result.hex_digest = bytes_to_hex(hash, hash_len);
    result.ok = true;
    return result;
}

// ============================================================================
// DiskRemoteCache
// ============================================================================

namespace {

const char* CONTENT_SUFFIX = ".content";
const char* METADATA_SUFFIX = ".meta.json";

std::optional<std::string> read_text(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::optional<CacheMetadata> parse_metadata(const std::string& json_str) {
    auto j = nlohmann::json::parse(json_str, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    CacheMetadata meta;
    if (!j.contains("url") || !j["url"].is_string()) return std::nullopt;
    if (!j.contains("fetched_at") || !j["fetched_at"].is_number_integer()) return std::nullopt;
    meta.url = j["url"].get<std::string>();
    meta.fetched_at = j["fetched_at"].get<int64_t>();
    if (j.contains("ttl_ms") && j["ttl_ms"].is_number_integer()) {
        meta.ttl_ms = j["ttl_ms"].get<int64_t>();
    }
    if (j.contains("etag") && j["etag"].is_string()) {
        meta.etag = j["etag"].get<std::string>();
    }
    if (j.contains("last_modified") && j["last_modified"].is_string()) {
        meta.last_modified = j["last_modified"].get<std::string>();
    }
    return meta;
}

std::string serialize_metadata(const CacheMetadata& meta) {
    nlohmann::json j;
    j["url"] = meta.url;
    j["fetched_at"] = meta.fetched_at;
    j["ttl_ms"] = meta.ttl_ms;
    if (meta.etag) j["etag"] = *meta.etag;
    if (meta.last_modified) j["last_modified"] = *meta.last_modified;
    return j.dump(2);
}

bool is_expired(const CacheMetadata& meta, int64_t default_ttl, int64_t now) {
    int64_t ttl = meta.ttl_ms > 0 ? meta.ttl_ms : default_ttl;
    return now - meta.fetched_at > ttl;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Hashes of all entries that have a metadata file
std::vector<std::string> list_entry_hashes(const std::string& dir) {
    std::vector<std::string> hashes;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return hashes;

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (ends_with(name, METADATA_SUFFIX)) {
            hashes.push_back(name.substr(0, name.size() - std::string(METADATA_SUFFIX).size()));
        }
    }
    return hashes;
}

} // namespace

DiskRemoteCache::DiskRemoteCache(std::string dir, int64_t ttl_ms, bool no_cache)
    : dir_(std::move(dir)), ttl_ms_(ttl_ms), no_cache_(no_cache) {}

std::string DiskRemoteCache::content_path(const std::string& url) const {
    auto hash = compute_sha256(url);
    if (!hash.ok) return "";
    return join_path(dir_, hash.hex_digest + CONTENT_SUFFIX);
}

std::string DiskRemoteCache::metadata_path(const std::string& url) const {
    auto hash = compute_sha256(url);
    if (!hash.ok) return "";
    return join_path(dir_, hash.hex_digest + METADATA_SUFFIX);
}

CacheLookup DiskRemoteCache::lookup(const std::string& url) {
    CacheLookup result;
    if (no_cache_) {
        return result;
    }

    std::string meta_path = metadata_path(url);
    if (meta_path.empty()) return result;

    auto meta_raw = read_text(meta_path);
    if (!meta_raw) return result;

    auto meta = parse_metadata(*meta_raw);
    if (!meta) return result;

    auto content = read_text(content_path(url));
    if (!content) return result;

    result.metadata = meta;
    result.content = content;
    if (is_expired(*meta, ttl_ms_, now_millis())) {
        result.expired = true;
        return result;
    }

    result.hit = true;
    return result;
}

bool DiskRemoteCache::store(const std::string& url,
                            const std::string& content,
                            const CacheMetadata& metadata) {
    std::string c_path = content_path(url);
    std::string m_path = metadata_path(url);
    if (c_path.empty() || m_path.empty()) return false;

    if (!create_directories(dir_)) return false;

    CacheMetadata meta = metadata;
    meta.url = url;
    if (meta.fetched_at == 0) meta.fetched_at = now_millis();
    if (meta.ttl_ms == 0) meta.ttl_ms = ttl_ms_;

    // Content first so a visible metadata file always has content beside it
    if (!atomic_write_file(c_path, content).ok) return false;
    return atomic_write_file(m_path, serialize_metadata(meta)).ok;
}

bool DiskRemoteCache::refresh(const std::string& url) {
    std::string m_path = metadata_path(url);
    if (m_path.empty()) return false;

    auto meta_raw = read_text(m_path);
    if (!meta_raw) return false;
    auto meta = parse_metadata(*meta_raw);
    if (!meta) return false;

    meta->fetched_at = now_millis();
    return atomic_write_file(m_path, serialize_metadata(*meta)).ok;
}

bool DiskRemoteCache::invalidate(const std::string& url) {
    std::string c_path = content_path(url);
    std::string m_path = metadata_path(url);
    if (c_path.empty() || m_path.empty()) return false;
    bool removed_meta = remove_file(m_path);
    bool removed_content = remove_file(c_path);
    return removed_meta || removed_content;
}

size_t DiskRemoteCache::clear_expired() {
    size_t cleared = 0;
    int64_t now = now_millis();

    for (const auto& hash : list_entry_hashes(dir_)) {
        std::string m_path = join_path(dir_, hash + METADATA_SUFFIX);
        auto meta_raw = read_text(m_path);
        if (!meta_raw) continue;

        auto meta = parse_metadata(*meta_raw);
        // Unreadable metadata can never hit again
        if (!meta || is_expired(*meta, ttl_ms_, now)) {
            remove_file(m_path);
            remove_file(join_path(dir_, hash + CONTENT_SUFFIX));
            ++cleared;
        }
    }
    return cleared;
}

size_t DiskRemoteCache::clear_all() {
    size_t cleared = 0;
    for (const auto& hash : list_entry_hashes(dir_)) {
        remove_file(join_path(dir_, hash + METADATA_SUFFIX));
        remove_file(join_path(dir_, hash + CONTENT_SUFFIX));
        ++cleared;
    }
    return cleared;
}

CacheStats DiskRemoteCache::stats() const {
    CacheStats stats;

    for (const auto& hash : list_entry_hashes(dir_)) {
        auto meta_raw = read_text(join_path(dir_, hash + METADATA_SUFFIX));
        if (!meta_raw) continue;
        auto meta = parse_metadata(*meta_raw);
        if (!meta) continue;

        ++stats.entries;

        std::error_code ec;
        auto size = fs::file_size(join_path(dir_, hash + CONTENT_SUFFIX), ec);
        if (!ec) stats.total_bytes += size;

        if (!stats.oldest_fetch || meta->fetched_at < *stats.oldest_fetch) {
            stats.oldest_fetch = meta->fetched_at;
        }
        if (!stats.newest_fetch || meta->fetched_at > *stats.newest_fetch) {
            stats.newest_fetch = meta->fetched_at;
        }
    }

    return stats;
}

} // namespace mdexpand

#include <doctest/doctest.h>
#include <mdexpand/url_cache.hpp>

#include "test_helpers.hpp"

#include <chrono>

using namespace mdexpand;

namespace {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

TEST_CASE("compute_sha256 produces the hex digest") {
    auto result = compute_sha256("abc");
    REQUIRE(result.ok);
    CHECK(result.hex_digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("DiskRemoteCache stores and finds entries") {
    TempTestDir dir;
    DiskRemoteCache cache(dir.file("cache"), 60000);

    CacheMetadata meta;
    meta.etag = "\"v1\"";
    REQUIRE(cache.store("https://x.io/a.md", "# A", meta));

    auto lookup = cache.lookup("https://x.io/a.md");
    CHECK(lookup.hit);
    CHECK_FALSE(lookup.expired);
    REQUIRE(lookup.content.has_value());
    CHECK(*lookup.content == "# A");
    REQUIRE(lookup.metadata.has_value());
    CHECK(lookup.metadata->url == "https://x.io/a.md");
    CHECK(lookup.metadata->etag == std::optional<std::string>("\"v1\""));
    CHECK(lookup.metadata->ttl_ms == 60000);
    CHECK(lookup.metadata->fetched_at > 0);
}

TEST_CASE("DiskRemoteCache misses unknown URLs") {
    TempTestDir dir;
    DiskRemoteCache cache(dir.file("cache"), 60000);

    auto lookup = cache.lookup("https://x.io/none.md");
    CHECK_FALSE(lookup.hit);
    CHECK_FALSE(lookup.expired);
    CHECK_FALSE(lookup.content.has_value());
}

TEST_CASE("DiskRemoteCache reports expired entries with their content") {
    TempTestDir dir;
    DiskRemoteCache cache(dir.file("cache"), 60000);

    CacheMetadata meta;
    meta.fetched_at = now_ms() - 10000;
    meta.ttl_ms = 1000;
    meta.last_modified = "Tue, 01 Jan 2030 00:00:00 GMT";
    REQUIRE(cache.store("https://x.io/old.md", "old", meta));

    auto lookup = cache.lookup("https://x.io/old.md");
    CHECK_FALSE(lookup.hit);
    CHECK(lookup.expired);
    REQUIRE(lookup.content.has_value());
    CHECK(*lookup.content == "old");
    CHECK(lookup.metadata->last_modified == meta.last_modified);

    SUBCASE("refresh restarts the TTL") {
        REQUIRE(cache.refresh("https://x.io/old.md"));
        CHECK(cache.lookup("https://x.io/old.md").hit);
    }

    SUBCASE("clear_expired removes only stale entries") {
        REQUIRE(cache.store("https://x.io/new.md", "new", {}));
        CHECK(cache.clear_expired() == 1);
        CHECK_FALSE(cache.lookup("https://x.io/old.md").content.has_value());
        CHECK(cache.lookup("https://x.io/new.md").hit);
    }
}

TEST_CASE("DiskRemoteCache with no_cache always misses") {
    TempTestDir dir;
    DiskRemoteCache writer(dir.file("cache"), 60000);
    REQUIRE(writer.store("https://x.io/a.md", "A", {}));

    DiskRemoteCache bypass(dir.file("cache"), 60000, true);
    CHECK_FALSE(bypass.lookup("https://x.io/a.md").hit);
    CHECK(bypass.store("https://x.io/b.md", "B", {}));
    CHECK(writer.lookup("https://x.io/b.md").hit);
}

TEST_CASE("DiskRemoteCache invalidate and clear_all") {
    TempTestDir dir;
    DiskRemoteCache cache(dir.file("cache"), 60000);
    REQUIRE(cache.store("https://x.io/a.md", "AAAA", {}));
    REQUIRE(cache.store("https://x.io/b.md", "BB", {}));

    auto stats = cache.stats();
    CHECK(stats.entries == 2);
    CHECK(stats.total_bytes == 6);
    CHECK(stats.oldest_fetch.has_value());
    CHECK(stats.newest_fetch.has_value());

    CHECK(cache.invalidate("https://x.io/a.md"));
    CHECK_FALSE(cache.lookup("https://x.io/a.md").hit);
    CHECK(cache.stats().entries == 1);

    CHECK(cache.clear_all() == 1);
    CHECK(cache.stats().entries == 0);
    CHECK_FALSE(cache.refresh("https://x.io/b.md"));
}

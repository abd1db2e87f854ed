#include <doctest/doctest.h>
#include <mdexpand/scanner.hpp>

using namespace mdexpand;

TEST_CASE("find_safe_ranges covers text without code") {
    std::string text = "Plain text with @./a.md";
    auto ranges = find_safe_ranges(text);
    REQUIRE(ranges.size() == 1);
    CHECK(ranges[0] == SafeRange{0, text.size()});
}

TEST_CASE("find_safe_ranges excludes inline code") {
    std::string text = "a `b` c";
    auto ranges = find_safe_ranges(text);
    REQUIRE(ranges.size() == 2);
    CHECK(ranges[0] == SafeRange{0, 2});
    CHECK(ranges[1] == SafeRange{5, 7});
    CHECK_FALSE(is_in_safe_range(3, ranges));
    CHECK(is_in_safe_range(6, ranges));
}

TEST_CASE("find_safe_ranges excludes fenced code blocks") {
    std::string text = "x\n```\n@./a.md\n```\ny";
    auto ranges = find_safe_ranges(text);
    REQUIRE(ranges.size() == 2);
    CHECK(ranges[0] == SafeRange{0, 2});
    CHECK(ranges[1] == SafeRange{18, 19});
    CHECK_FALSE(is_in_safe_range(text.find('@'), ranges));
}

TEST_CASE("find_safe_ranges handles tilde fences") {
    std::string text = "~~~\n@x\n~~~\n";
    auto ranges = find_safe_ranges(text);
    CHECK(ranges.empty());
}

TEST_CASE("find_safe_ranges treats an unterminated fence as code to the end") {
    std::string text = "a\n```\ncode @./a.md";
    auto ranges = find_safe_ranges(text);
    REQUIRE(ranges.size() == 1);
    CHECK(ranges[0] == SafeRange{0, 2});
}

TEST_CASE("find_safe_ranges requires a closing fence at least as long") {
    std::string text = "````\n```\n@./a.md\n````\nafter";
    auto ranges = find_safe_ranges(text);
    REQUIRE(ranges.size() == 1);
    CHECK(text.substr(ranges[0].start, ranges[0].end - ranges[0].start) == "after");
}

TEST_CASE("find_unsafe_block_starts reports where code begins") {
    SUBCASE("inline code in the middle") {
        std::string text = "a `b` c";
        auto starts = find_unsafe_block_starts(text, find_safe_ranges(text));
        CHECK(starts == std::set<size_t>{2});
    }

    SUBCASE("fence at the start of the document") {
        std::string text = "~~~\ncode\n~~~\n";
        auto starts = find_unsafe_block_starts(text, find_safe_ranges(text));
        CHECK(starts.count(0) == 1);
    }

    SUBCASE("no code") {
        std::string text = "nothing here";
        auto starts = find_unsafe_block_starts(text, find_safe_ranges(text));
        CHECK(starts.empty());
    }
}

#include <doctest/doctest.h>
#include <mdexpand/text_utils.hpp>

using namespace mdexpand;

TEST_CASE("trim removes surrounding whitespace") {
    CHECK(trim("  a b \n") == "a b");
    CHECK(trim("\t\n ") == "");
    CHECK(trim("x") == "x");
}

TEST_CASE("strip_ansi removes escape sequences") {
    CHECK(strip_ansi("\x1b[31mred\x1b[0m") == "red");
    CHECK(strip_ansi("\x1b[1;32mbold green\x1b[0m text") == "bold green text");
    CHECK(strip_ansi("plain") == "plain");
}

TEST_CASE("truncate_output reports the removed count") {
    CHECK(truncate_output("abc", 3) == "abc");
    CHECK(truncate_output("abcdef", 3) == "abc\n... [Output truncated: 3 characters removed]");
}

TEST_CASE("contains_null_byte looks only at the prefix") {
    std::string data("ab\0cd", 5);
    CHECK(contains_null_byte(data, 8192));
    CHECK(contains_null_byte(data, 3));
    CHECK_FALSE(contains_null_byte(data, 2));
    CHECK_FALSE(contains_null_byte("text", 8192));
}

TEST_CASE("has_binary_extension matches known binary formats") {
    CHECK(has_binary_extension("image.png"));
    CHECK(has_binary_extension("docs/Report.PDF"));
    CHECK(has_binary_extension("build/main.o"));
    CHECK(has_binary_extension("dir/.DS_Store"));
    CHECK_FALSE(has_binary_extension("notes.md"));
    CHECK_FALSE(has_binary_extension("dir/Makefile"));
}

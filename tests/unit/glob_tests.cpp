#include <doctest/doctest.h>
#include <mdexpand/glob.hpp>

#include "test_helpers.hpp"

using namespace mdexpand;

TEST_CASE("glob_match single segment wildcards") {
    CHECK(glob_match("*.md", "a.md"));
    CHECK(glob_match("./*.md", "./a.md"));
    CHECK_FALSE(glob_match("*.md", "dir/a.md"));
    CHECK(glob_match("?.txt", "a.txt"));
    CHECK_FALSE(glob_match("?.txt", "ab.txt"));
}

TEST_CASE("glob_match character classes") {
    CHECK(glob_match("[abc].txt", "b.txt"));
    CHECK_FALSE(glob_match("[abc].txt", "d.txt"));
    CHECK(glob_match("[a-c].txt", "c.txt"));
    CHECK_FALSE(glob_match("[!abc].txt", "b.txt"));
    CHECK(glob_match("[!abc].txt", "z.txt"));
}

TEST_CASE("glob_match globstar spans directories") {
    CHECK(glob_match("**/*.md", "a.md"));
    CHECK(glob_match("**/*.md", "dir/sub/a.md"));
    CHECK(glob_match("src/**/test.ts", "src/test.ts"));
    CHECK(glob_match("src/**/test.ts", "src/a/b/test.ts"));
    CHECK_FALSE(glob_match("src/**/test.ts", "lib/test.ts"));
}

TEST_CASE("glob_match does not match hidden names implicitly") {
    CHECK_FALSE(glob_match("*.md", ".hidden.md"));
    CHECK(glob_match(".*.md", ".hidden.md"));
    CHECK_FALSE(glob_match("**/*.md", ".git/a.md"));
}

TEST_CASE("glob_match expands braces") {
    CHECK(glob_match("src/*.{ts,js}", "src/a.js"));
    CHECK(glob_match("src/*.{ts,js}", "src/a.ts"));
    CHECK_FALSE(glob_match("src/*.{ts,js}", "src/a.py"));
}

TEST_CASE("expand_braces produces every combination") {
    CHECK(expand_braces("plain") == std::vector<std::string>{"plain"});
    CHECK(expand_braces("a{b,c}d{e,f}") ==
          std::vector<std::string>{"abde", "abdf", "acde", "acdf"});
    CHECK(expand_braces("unclosed{a,b") == std::vector<std::string>{"unclosed{a,b"});
}

TEST_CASE("expand_glob walks the filesystem") {
    TempTestDir dir;
    std::string a = dir.write("a.md", "A");
    std::string b = dir.write("b.md", "B");
    std::string c = dir.write("sub/c.md", "C");
    std::string d = dir.write("sub/d.txt", "D");
    dir.write(".hidden/e.md", "E");

    SUBCASE("single level") {
        CHECK(expand_glob("*.md", dir.path) == std::vector<std::string>{a, b});
    }

    SUBCASE("recursive") {
        CHECK(expand_glob("**/*.md", dir.path) == std::vector<std::string>{a, b, c});
    }

    SUBCASE("literal directory prefix") {
        CHECK(expand_glob("./sub/*.txt", dir.path) == std::vector<std::string>{d});
    }

    SUBCASE("braces") {
        CHECK(expand_glob("sub/*.{md,txt}", dir.path) == std::vector<std::string>{c, d});
    }

    SUBCASE("fully literal pattern") {
        CHECK(expand_glob("sub/c.md", dir.path) == std::vector<std::string>{c});
        CHECK(expand_glob("sub/none.md", dir.path).empty());
    }

    SUBCASE("absolute pattern") {
        CHECK(expand_glob(dir.path + "/sub/*.md", "/unused") == std::vector<std::string>{c});
    }

    SUBCASE("explicit hidden directory") {
        CHECK(expand_glob(".hidden/*.md", dir.path).size() == 1);
    }
}

TEST_CASE("IgnoreRules defaults") {
    auto rules = IgnoreRules::with_defaults();
    CHECK(rules.size() == 4);
    CHECK(rules.ignores("node_modules/pkg/index.js"));
    CHECK(rules.ignores(".git/config"));
    CHECK(rules.ignores("debug.log"));
    CHECK(rules.ignores("a/b/c.log"));
    CHECK(rules.ignores("sub/.DS_Store"));
    CHECK_FALSE(rules.ignores("src/a.ts"));
}

TEST_CASE("IgnoreRules directory-only rules") {
    IgnoreRules rules;
    rules.add("build/");
    CHECK(rules.ignores("build/out.js"));
    CHECK(rules.ignores("pkg/build/out.js"));
    CHECK_FALSE(rules.ignores("build"));
}

TEST_CASE("IgnoreRules anchored rules") {
    IgnoreRules rules;
    rules.add("/root.txt");
    rules.add("docs/*.tmp");
    CHECK(rules.ignores("root.txt"));
    CHECK_FALSE(rules.ignores("sub/root.txt"));
    CHECK(rules.ignores("docs/a.tmp"));
    CHECK_FALSE(rules.ignores("other/docs/a.tmp"));
}

TEST_CASE("IgnoreRules negation re-includes files") {
    IgnoreRules rules;
    rules.add("*.tmp");
    rules.add("!keep.tmp");
    CHECK(rules.ignores("a.tmp"));
    CHECK_FALSE(rules.ignores("keep.tmp"));
}

TEST_CASE("IgnoreRules cannot re-include below an ignored directory") {
    IgnoreRules rules;
    rules.add("out/");
    rules.add("!out/keep.md");
    CHECK(rules.ignores("out/keep.md"));
}

TEST_CASE("IgnoreRules add_lines skips comments and blanks") {
    IgnoreRules rules;
    rules.add_lines("# comment\n\n*.bak\n   \n\\#literal\n");
    CHECK(rules.size() == 2);
    CHECK(rules.ignores("file.bak"));
    CHECK(rules.ignores("#literal"));
    CHECK_FALSE(rules.ignores("comment"));
}

#include <doctest/doctest.h>
#include <mdexpand/import_stack.hpp>

using namespace mdexpand;

TEST_CASE("ImportStack starts empty") {
    ImportStack stack;
    CHECK(stack.empty());
    CHECK(stack.size() == 0);
    CHECK_FALSE(stack.contains("/a.md"));
}

TEST_CASE("ImportStack extended returns a new stack") {
    ImportStack root;
    ImportStack a = root.extended("/doc/a.md");
    ImportStack ab = a.extended("/doc/b.md");

    CHECK(root.empty());
    CHECK(a.size() == 1);
    CHECK(ab.size() == 2);
    CHECK(ab.contains("/doc/a.md"));
    CHECK(ab.contains("/doc/b.md"));
    CHECK_FALSE(a.contains("/doc/b.md"));
}

TEST_CASE("ImportStack siblings do not see each other") {
    ImportStack parent = ImportStack().extended("/doc/main.md");
    ImportStack left = parent.extended("/doc/shared.md");
    ImportStack right = parent.extended("/doc/other.md");

    CHECK(left.contains("/doc/shared.md"));
    CHECK_FALSE(right.contains("/doc/shared.md"));
}

TEST_CASE("ImportStack chain_to renders the cycle") {
    ImportStack stack = ImportStack().extended("/doc/a.md").extended("/doc/b.md");
    CHECK(stack.chain_to("/doc/a.md") == "/doc/a.md -> /doc/b.md -> /doc/a.md");
    CHECK(ImportStack().chain_to("/x.md") == "/x.md");
}

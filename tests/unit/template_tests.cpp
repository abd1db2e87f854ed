#include <doctest/doctest.h>
#include <mdexpand/template.hpp>

using namespace mdexpand;

TEST_CASE("substitute replaces known variables") {
    std::unordered_map<std::string, std::string> vars = {{"name", "World"}};
    CHECK(substitute("Hello {{ name }}!", vars) == "Hello World!");
    CHECK(substitute("Hello {{name}}!", vars) == "Hello World!");
    CHECK(substitute("{{ name }} and {{ name }}", vars) == "World and World");
}

TEST_CASE("substitute keeps unknown variables") {
    std::unordered_map<std::string, std::string> vars = {{"a", "1"}};
    std::vector<std::string> missing;
    std::string out = substitute("{{ a }} {{ b }} {{ c }} {{ b }}", vars, missing);
    CHECK(out == "1 {{ b }} {{ c }} {{ b }}");
    CHECK(missing == std::vector<std::string>{"b", "c"});
}

TEST_CASE("substitute leaves non-identifiers alone") {
    std::unordered_map<std::string, std::string> vars = {{"x", "1"}};
    CHECK(substitute("{{ not valid }}", vars) == "{{ not valid }}");
    CHECK(substitute("{{ 1x }}", vars) == "{{ 1x }}");
}

TEST_CASE("substitute copies raw blocks untouched") {
    std::unordered_map<std::string, std::string> vars = {{"x", "1"}};
    std::string text = "{% raw %}{{ x }}{% endraw %} {{ x }}";
    CHECK(substitute(text, vars) == "{% raw %}{{ x }}{% endraw %} 1");
}

TEST_CASE("substitute copies an unclosed raw block to the end") {
    std::unordered_map<std::string, std::string> vars = {{"x", "1"}};
    CHECK(substitute("{{ x }} {% raw %}{{ x }}", vars) == "1 {% raw %}{{ x }}");
}

TEST_CASE("substitute is idempotent") {
    std::unordered_map<std::string, std::string> vars = {{"x", "{{ x }}"}, {"y", "2"}};
    std::string text = "{{ y }} " + wrap_raw("{{ x }}");
    std::string once = substitute(text, vars);
    CHECK(once == "2 " + wrap_raw("{{ x }}"));
    CHECK(substitute(once, vars) == once);
    CHECK(substitute(wrap_raw("{{ y }}"), vars) == wrap_raw("{{ y }}"));
}

TEST_CASE("wrap_raw and strip_raw_markers") {
    CHECK(wrap_raw("hi") == "{% raw %}<!--mdexpand-->\nhi\n<!--mdexpand-->{% endraw %}");
    CHECK(strip_raw_markers("Output: " + wrap_raw("hello")) == "Output: hello");
    CHECK(strip_raw_markers(wrap_raw("a") + " " + wrap_raw("b")) == "a b");
    CHECK(strip_raw_markers(wrap_raw("")) == "");
    CHECK(strip_raw_markers("nothing") == "nothing");
}

TEST_CASE("strip_raw_markers keeps raw blocks the author wrote") {
    std::string authored = "Use {% raw %}{{ name }}{% endraw %} in templates.\n{% raw %}\nblock\n{% endraw %}";
    CHECK(strip_raw_markers(authored) == authored);
    CHECK(strip_raw_markers(authored + " " + wrap_raw("out")) == authored + " out");
}

TEST_CASE("wrapped output survives a substitution pass and is then unwrapped") {
    std::unordered_map<std::string, std::string> vars = {{"x", "1"}};
    std::string text = "{{ x }} " + wrap_raw("{{ x }}") + " {% raw %}{{ x }}{% endraw %}";
    CHECK(strip_raw_markers(substitute(text, vars)) == "1 {{ x }} {% raw %}{{ x }}{% endraw %}");
}

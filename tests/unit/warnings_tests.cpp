#include <doctest/doctest.h>
#include <mdexpand/warnings.hpp>
#include <mdexpand/types.hpp>

#include <thread>

using namespace mdexpand;

TEST_CASE("warning_to_string returns correct warning key") {
    CHECK(std::string(warning_to_string(Warning::glob_binary_skipped)) == "glob_binary_skipped");
    CHECK(std::string(warning_to_string(Warning::high_token_count)) == "high_token_count");
    CHECK(std::string(warning_to_string(Warning::invalid_configuration)) == "invalid_configuration");
}

TEST_CASE("parse_warning_key parses known warning keys") {
    CHECK(parse_warning_key("glob_binary_skipped") == Warning::glob_binary_skipped);
    CHECK(parse_warning_key("high_token_count") == Warning::high_token_count);
    CHECK(parse_warning_key("invalid_configuration") == Warning::invalid_configuration);
}

TEST_CASE("parse_warning_key returns nullopt for unknown keys") {
    CHECK_FALSE(parse_warning_key("unknown_warning").has_value());
    CHECK_FALSE(parse_warning_key("").has_value());
}

TEST_CASE("parse_warning_action accepts the three actions") {
    CHECK(parse_warning_action("warn") == WarningAction::Warn);
    CHECK(parse_warning_action("ignore") == WarningAction::Ignore);
    CHECK(parse_warning_action("error") == WarningAction::Error);
    CHECK_FALSE(parse_warning_action("explode").has_value());
}

TEST_CASE("WarningCollector default policy is warn") {
    WarningCollector collector;

    collector.emit(Warning::glob_binary_skipped, warnings::glob_binary_skipped("*.png", "a.png"));

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].action == "warn");
    CHECK(warnings[0].key == "glob_binary_skipped");
    CHECK(warnings[0].fields.at("path") == "a.png");
}

TEST_CASE("WarningCollector applies error policy") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["high_token_count"] = WarningAction::Error;

    WarningCollector collector(policy);
    collector.emit(Warning::high_token_count, warnings::high_token_count("**/*", 90000, 128000));

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].action == "error");
    CHECK(warnings[0].fields.at("tokens") == "90000");
    CHECK(collector.has_errors());
}

TEST_CASE("WarningCollector applies ignore policy") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["glob_binary_skipped"] = WarningAction::Ignore;

    WarningCollector collector(policy);
    collector.emit(Warning::glob_binary_skipped);

    CHECK(collector.get_warnings().empty());
    CHECK_FALSE(collector.has_effective_warnings());
    CHECK_FALSE(collector.has_errors());
}

TEST_CASE("WarningCollector overrides win over policy") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["high_token_count"] = WarningAction::Ignore;

    WarningCollector collector(policy);
    collector.apply_override("HIGH_TOKEN_COUNT", WarningAction::Error);
    collector.emit("high_token_count");

    CHECK(collector.has_errors());
}

TEST_CASE("WarningCollector emits by key string") {
    WarningCollector collector;
    collector.emit("invalid_configuration", warnings::invalid_configuration("unknown_key:x", "/c.json"));

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].fields.at("reason") == "unknown_key:x");
    CHECK(warnings[0].fields.at("source_path") == "/c.json");
}

TEST_CASE("WarningCollector clear removes everything") {
    WarningCollector collector;
    collector.emit(Warning::high_token_count);
    CHECK(collector.has_effective_warnings());
    collector.clear();
    CHECK(collector.get_warnings().empty());
}

TEST_CASE("WarningCollector accepts concurrent emits") {
    WarningCollector collector;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&collector]() {
            for (int i = 0; i < 25; ++i) {
                collector.emit(Warning::glob_binary_skipped);
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(collector.get_warnings().size() == 200);
}

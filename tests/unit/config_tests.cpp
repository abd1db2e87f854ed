#include <doctest/doctest.h>
#include <mdexpand/config.hpp>

#include "test_helpers.hpp"

#include <algorithm>

using namespace mdexpand;

TEST_CASE("get_default_config uses the documented limits") {
    auto config = get_default_config();
    CHECK(config.max_file_size == 10 * 1024 * 1024);
    CHECK(config.command_timeout_ms == 30000);
    CHECK(config.max_command_output == 100000);
    CHECK(config.concurrency_limit == 10);
    CHECK(config.cache_ttl_ms == 3600000);
    CHECK(config.self_command == "mdexpand");
    CHECK_FALSE(config.cache_dir.empty());
    CHECK_FALSE(config.force_context);
}

TEST_CASE("parse_config reads a full document") {
    const char* json = R"({
        "$schema": "mdexpand.config.v1",
        "command_timeout_ms": 5000,
        "concurrency_limit": 4,
        "model": "claude-3-opus",
        "force_context": true,
        "warnings": {"HIGH_TOKEN_COUNT": "error", "glob_binary_skipped": "ignore"}
    })";

    auto result = parse_config(json, "/etc/mdexpand.json");
    REQUIRE(result.ok);
    CHECK(result.warnings.empty());
    CHECK(result.config.command_timeout_ms == 5000);
    CHECK(result.config.concurrency_limit == 4);
    CHECK(result.config.force_context);
    CHECK(result.config.source_path == "/etc/mdexpand.json");
    CHECK(context_limit(result.config) == 200000);
    CHECK(result.config.warnings["high_token_count"] == WarningAction::Error);
    CHECK(result.config.warnings["glob_binary_skipped"] == WarningAction::Ignore);
}

TEST_CASE("parse_config requires the schema marker") {
    auto missing = parse_config(R"({"command_timeout_ms": 1})");
    CHECK_FALSE(missing.ok);
    CHECK(missing.error == "$schema missing");

    auto wrong = parse_config(R"({"$schema": "other.v2"})");
    CHECK_FALSE(wrong.ok);
    CHECK(wrong.error.find("$schema mismatch") == 0);
}

TEST_CASE("parse_config rejects malformed documents") {
    CHECK_FALSE(parse_config("{not json").ok);
    CHECK_FALSE(parse_config("[1, 2]").ok);
}

TEST_CASE("parse_config reports unusable values as warnings") {
    auto result = parse_config(R"({
        "$schema": "mdexpand.config.v1",
        "bogus": 1,
        "concurrency_limit": 0,
        "warnings": {"high_token_count": "explode"}
    })");
    REQUIRE(result.ok);
    CHECK(result.config.concurrency_limit == DEFAULT_CONCURRENCY_LIMIT);

    auto has = [&result](const std::string& w) {
        return std::find(result.warnings.begin(), result.warnings.end(), w) != result.warnings.end();
    };
    CHECK(has("invalid_configuration:unknown_key:bogus"));
    CHECK(has("invalid_configuration:concurrency_limit"));
    CHECK(has("invalid_configuration:invalid_warning_action:high_token_count"));
}

TEST_CASE("context_limit prefers an explicit window") {
    Config config = get_default_config();
    config.model = "gemini-1.5-pro";
    CHECK(context_limit(config) == 1000000);
    config.context_window = 5000;
    CHECK(context_limit(config) == 5000);
}

TEST_CASE("context_limit_for_model by family") {
    CHECK(context_limit_for_model("Claude-Sonnet") == 200000);
    CHECK(context_limit_for_model("gemini-pro") == 1000000);
    CHECK(context_limit_for_model("gpt-4o-mini") == 128000);
    CHECK(context_limit_for_model("") == DEFAULT_CONTEXT_LIMIT);
}

TEST_CASE("exceeds_limit compares against max_file_size") {
    Config config = get_default_config();
    config.max_file_size = 100;
    CHECK_FALSE(exceeds_limit(config, 100));
    CHECK(exceeds_limit(config, 101));
}

TEST_CASE("format_bytes picks a unit") {
    CHECK(format_bytes(512) == "512 bytes");
    CHECK(format_bytes(1536) == "1.5KB");
    CHECK(format_bytes(10 * 1024 * 1024) == "10.0MB");
}

TEST_CASE("apply_env_overrides applies parseable values") {
    Config config = get_default_config();
    auto warnings = apply_env_overrides(config, {
        {"MDEXPAND_COMMAND_TIMEOUT_MS", "1500"},
        {"MDEXPAND_CONCURRENCY", "abc"},
        {"MDEXPAND_FORCE_CONTEXT", "1"},
        {"MDEXPAND_MODEL", " claude-3 "},
        {"UNRELATED", "x"},
    });

    CHECK(config.command_timeout_ms == 1500);
    CHECK(config.concurrency_limit == DEFAULT_CONCURRENCY_LIMIT);
    CHECK(config.force_context);
    CHECK(config.model == "claude-3");

    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].key == "invalid_configuration");
    CHECK(warnings[0].fields.at("target") == "MDEXPAND_CONCURRENCY");
    CHECK(warnings[0].fields.at("reason") == "parse_failure");
    CHECK(warnings[0].fields.at("source_kind") == "process_env");
}

TEST_CASE("apply_env_overrides rejects zero limits") {
    Config config = get_default_config();
    auto warnings = apply_env_overrides(config, {
        {"MDEXPAND_COMMAND_TIMEOUT_MS", "0"},
        {"MDEXPAND_CONCURRENCY", "0"},
    });
    CHECK(config.command_timeout_ms == DEFAULT_COMMAND_TIMEOUT_MS);
    CHECK(config.concurrency_limit == DEFAULT_CONCURRENCY_LIMIT);
    CHECK(warnings.size() == 2);
}

TEST_CASE("apply_env_overrides reads false-like flags") {
    Config config = get_default_config();
    config.force_context = true;
    apply_env_overrides(config, {{"MDEXPAND_FORCE_CONTEXT", "false"}});
    CHECK_FALSE(config.force_context);
}

TEST_CASE("load_config reads files from disk") {
    TempTestDir dir;

    SUBCASE("explicit path") {
        std::string path = dir.write("config.json",
            R"({"$schema": "mdexpand.config.v1", "max_file_size": 2048})");
        auto result = load_config(path);
        REQUIRE(result.ok);
        CHECK(result.config.max_file_size == 2048);
        CHECK(result.config.source_path == path);
    }

    SUBCASE("missing explicit path is an error") {
        auto result = load_config(dir.file("absent.json"));
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("config file not found") == 0);
    }
}

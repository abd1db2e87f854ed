#include <doctest/doctest.h>
#include <mdexpand/process.hpp>

#include "test_helpers.hpp"

#include <chrono>

using namespace mdexpand;

#ifndef _WIN32

TEST_CASE("run_process captures stdout") {
    auto result = run_process(shell_argv("echo hello"), {});
    REQUIRE(result.ok);
    CHECK(result.exit_code == 0);
    CHECK(result.stdout_text == "hello\n");
    CHECK(result.stderr_text.empty());
    CHECK_FALSE(result.timed_out);
}

TEST_CASE("run_process captures stderr separately") {
    auto result = run_process(shell_argv("echo out; echo err 1>&2"), {});
    REQUIRE(result.ok);
    CHECK(result.stdout_text == "out\n");
    CHECK(result.stderr_text == "err\n");
}

TEST_CASE("run_process reports the exit code") {
    auto result = run_process(shell_argv("exit 3"), {});
    REQUIRE(result.ok);
    CHECK(result.exit_code == 3);
}

TEST_CASE("run_process runs in the requested directory") {
    TempTestDir dir;
    ProcessOptions options;
    options.cwd = dir.path;

    auto result = run_process(shell_argv("pwd -P"), options);
    REQUIRE(result.ok);
    CHECK(result.stdout_text == dir.path + "\n");
}

TEST_CASE("run_process passes an explicit environment") {
    ProcessOptions options;
    options.env = {{"GREETING", "bonjour"}};

    auto result = run_process(shell_argv("echo \"$GREETING\""), options);
    REQUIRE(result.ok);
    CHECK(result.stdout_text == "bonjour\n");
}

TEST_CASE("run_process reads no input") {
    auto result = run_process(shell_argv("cat"), {});
    REQUIRE(result.ok);
    CHECK(result.exit_code == 0);
    CHECK(result.stdout_text.empty());
}

TEST_CASE("run_process kills commands that exceed the timeout") {
    ProcessOptions options;
    options.timeout_ms = 200;

    auto start = std::chrono::steady_clock::now();
    auto result = run_process(shell_argv("sleep 5"), options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.ok);
    CHECK(result.timed_out);
    CHECK(elapsed < std::chrono::seconds(3));
}

TEST_CASE("run_process times out a child that has closed its output") {
    ProcessOptions options;
    options.timeout_ms = 500;

    auto start = std::chrono::steady_clock::now();
    auto result = run_process(shell_argv("exec sleep 3 >/dev/null 2>&1"), options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.ok);
    CHECK(result.timed_out);
    CHECK(elapsed < std::chrono::milliseconds(2500));
}

TEST_CASE("run_process reaps a quiet child that exits before the deadline") {
    ProcessOptions options;
    options.timeout_ms = 5000;

    auto result = run_process(shell_argv("exec sh -c 'sleep 0.1; exit 4' >/dev/null 2>&1"), options);
    REQUIRE(result.ok);
    CHECK_FALSE(result.timed_out);
    CHECK(result.exit_code == 4);
}

TEST_CASE("run_process reports a missing executable as exit 127") {
    auto result = run_process({"/nonexistent/mdexpand-test-binary"}, {});
    REQUIRE(result.ok);
    CHECK(result.exit_code == 127);
}

TEST_CASE("run_process rejects an empty argv") {
    auto result = run_process({}, {});
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
}

#endif

TEST_CASE("shell_argv wraps the command for the platform shell") {
    auto argv = shell_argv("echo hi");
    REQUIRE_FALSE(argv.empty());
    CHECK(argv.back() == "echo hi");
}

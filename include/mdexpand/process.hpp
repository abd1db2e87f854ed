#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace mdexpand {

// ============================================================================
// Process Execution
// ============================================================================

struct ProcessOptions {
    std::string cwd;                                   // empty: inherit
    std::unordered_map<std::string, std::string> env;  // empty: inherit
    int timeout_ms = 0;                                // 0: no deadline
};

struct ProcessResult {
    bool ok = false;          // spawned and reaped; says nothing about exit_code
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
    std::string error;
};

/**
 * Run argv[0] with the given arguments and capture both streams.
 *
 * argv[0] must be a path; no PATH lookup is done. The child runs in its own
 * process group so that a timeout kills the whole tree with SIGKILL.
 * stdin is /dev/null.
 */
ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options);

// Argument vector that runs a command line through the platform shell
std::vector<std::string> shell_argv(const std::string& command);

} // namespace mdexpand

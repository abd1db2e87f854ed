#pragma once

#include "mdexpand/types.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace mdexpand {

// ============================================================================
// Limits
// ============================================================================

constexpr uint64_t DEFAULT_MAX_FILE_SIZE = 10 * 1024 * 1024;
constexpr int DEFAULT_COMMAND_TIMEOUT_MS = 30000;
constexpr size_t DEFAULT_MAX_COMMAND_OUTPUT = 100000;
constexpr size_t DEFAULT_CONCURRENCY_LIMIT = 10;
constexpr int64_t DEFAULT_CACHE_TTL_MS = 60 * 60 * 1000;
constexpr size_t DEFAULT_CONTEXT_LIMIT = 128000;

constexpr const char* CONFIG_SCHEMA = "mdexpand.config.v1";

// "512 bytes", "1.5KB", "10.0MB"
std::string format_bytes(uint64_t bytes);

// ============================================================================
// Configuration
// ============================================================================

struct Config {
    uint64_t max_file_size = DEFAULT_MAX_FILE_SIZE;
    int command_timeout_ms = DEFAULT_COMMAND_TIMEOUT_MS;
    size_t max_command_output = DEFAULT_MAX_COMMAND_OUTPUT;
    size_t concurrency_limit = DEFAULT_CONCURRENCY_LIMIT;

    // 0 means look the model up in the context table
    size_t context_window = 0;
    std::string model;
    bool force_context = false;

    // Prefixed to commands that invoke a markdown file directly
    std::string self_command = "mdexpand";

    std::string cache_dir;  // empty: ~/.mdexpand/cache
    int64_t cache_ttl_ms = DEFAULT_CACHE_TTL_MS;
    bool no_cache = false;

    std::unordered_map<std::string, WarningAction> warnings;

    std::string source_path;
};

Config get_default_config();

bool exceeds_limit(const Config& config, uint64_t bytes);

// Token budget for glob imports: explicit window, else by model family
size_t context_limit(const Config& config);
size_t context_limit_for_model(const std::string& model);

// ~/.mdexpand
std::string default_config_home();
std::string default_cache_dir();

// ============================================================================
// Config Parsing
// ============================================================================

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    Config config;
    std::vector<std::string> warnings;  // "invalid_configuration:<detail>"
};

// Parse a config document over the defaults
ConfigParseResult parse_config(const std::string& json_str,
                               const std::string& source_path = "");

// Load an explicit path, or ~/.mdexpand/config.json when path is empty.
// A missing default file is not an error.
ConfigParseResult load_config(const std::string& path = "");

// Apply MDEXPAND_* variables. Unparseable values are skipped and reported.
std::vector<WarningObject> apply_env_overrides(
    Config& config,
    const std::unordered_map<std::string, std::string>& process_env);

} // namespace mdexpand

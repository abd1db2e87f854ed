#include "mdexpand/config.hpp"
#include "mdexpand/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace mdexpand {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<uint64_t> get_unsigned(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number_unsigned()) {
        return j[key].get<uint64_t>();
    }
    return std::nullopt;
}

std::optional<bool> get_bool(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return std::nullopt;
}

std::optional<uint64_t> parse_unsigned(const std::string& value) {
    std::string v = trim(value);
    if (v.empty() || !std::all_of(v.begin(), v.end(),
                                  [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return std::stoull(v);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool parse_flag(const std::string& value) {
    std::string v = to_lower(trim(value));
    return !v.empty() && v != "0" && v != "false" && v != "no";
}

const std::set<std::string>& known_keys() {
    static const std::set<std::string> keys = {
        "$schema", "max_file_size", "command_timeout_ms", "max_command_output",
        "concurrency_limit", "context_window", "model", "force_context",
        "self_command", "cache_dir", "cache_ttl_ms", "no_cache", "warnings",
    };
    return keys;
}

} // namespace

std::string format_bytes(uint64_t bytes) {
    char buf[32];
    if (bytes < 1024) {
        return std::to_string(bytes) + " bytes";
    }
    if (bytes < 1024 * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1fKB", static_cast<double>(bytes) / 1024.0);
        return buf;
    }
    std::snprintf(buf, sizeof(buf), "%.1fMB", static_cast<double>(bytes) / (1024.0 * 1024.0));
    return buf;
}

Config get_default_config() {
    Config config;
    config.cache_dir = default_cache_dir();
    config.warnings["glob_binary_skipped"] = WarningAction::Warn;
    config.warnings["high_token_count"] = WarningAction::Warn;
    return config;
}

bool exceeds_limit(const Config& config, uint64_t bytes) {
    return bytes > config.max_file_size;
}

size_t context_limit_for_model(const std::string& model) {
    std::string m = to_lower(model);
    if (m.find("claude") != std::string::npos) return 200000;
    if (m.find("gemini") != std::string::npos) return 1000000;
    if (m.find("gpt-4o") != std::string::npos) return 128000;
    return DEFAULT_CONTEXT_LIMIT;
}

size_t context_limit(const Config& config) {
    if (config.context_window > 0) {
        return config.context_window;
    }
    return context_limit_for_model(config.model);
}

std::string default_config_home() {
    return join_path(home_directory(), ".mdexpand");
}

std::string default_cache_dir() {
    return join_path(default_config_home(), "cache");
}

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config = get_default_config();
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        auto schema = get_string(j, "$schema");
        if (!schema) {
            result.error = "$schema missing";
            return result;
        }
        if (trim(*schema) != CONFIG_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + CONFIG_SCHEMA;
            return result;
        }

        for (const auto& item : j.items()) {
            if (known_keys().count(item.key()) == 0) {
                result.warnings.push_back("invalid_configuration:unknown_key:" + item.key());
            }
        }

        Config& c = result.config;

        if (auto v = get_unsigned(j, "max_file_size")) c.max_file_size = *v;
        if (auto v = get_unsigned(j, "command_timeout_ms")) c.command_timeout_ms = static_cast<int>(*v);
        if (auto v = get_unsigned(j, "max_command_output")) c.max_command_output = static_cast<size_t>(*v);
        if (auto v = get_unsigned(j, "concurrency_limit")) {
            if (*v == 0) {
                result.warnings.push_back("invalid_configuration:concurrency_limit");
            } else {
                c.concurrency_limit = static_cast<size_t>(*v);
            }
        }
        if (auto v = get_unsigned(j, "context_window")) c.context_window = static_cast<size_t>(*v);
        if (auto v = get_string(j, "model")) c.model = *v;
        if (auto v = get_bool(j, "force_context")) c.force_context = *v;
        if (auto v = get_string(j, "self_command")) c.self_command = *v;
        if (auto v = get_string(j, "cache_dir")) c.cache_dir = expand_tilde(*v);
        if (auto v = get_unsigned(j, "cache_ttl_ms")) c.cache_ttl_ms = static_cast<int64_t>(*v);
        if (auto v = get_bool(j, "no_cache")) c.no_cache = *v;

        // "warnings" section
        if (j.contains("warnings") && j["warnings"].is_object()) {
            for (auto& [key, val] : j["warnings"].items()) {
                if (!val.is_string()) continue;
                std::string key_str = to_lower(key);
                auto action = parse_warning_action(val.get<std::string>());
                if (action) {
                    c.warnings[key_str] = *action;
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_warning_action:" + key_str);
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

ConfigParseResult load_config(const std::string& path) {
    std::string config_path = path;
    bool explicit_path = !path.empty();
    if (!explicit_path) {
        config_path = join_path(default_config_home(), "config.json");
    }

    if (!is_regular_file(config_path)) {
        if (explicit_path) {
            ConfigParseResult result;
            result.error = "config file not found: " + config_path;
            return result;
        }
        ConfigParseResult result;
        result.ok = true;
        result.config = get_default_config();
        return result;
    }

    std::ifstream file(config_path, std::ios::binary);
    if (!file) {
        ConfigParseResult result;
        result.error = "failed to open config file: " + config_path;
        return result;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_config(buffer.str(), config_path);
}

std::vector<WarningObject> apply_env_overrides(
    Config& config,
    const std::unordered_map<std::string, std::string>& process_env) {
    std::vector<WarningObject> warnings;

    auto invalid = [&warnings](const std::string& name) {
        warnings.push_back({
            warning_to_string(Warning::invalid_configuration),
            "warn",
            {{"target", name}, {"reason", "parse_failure"}, {"source_kind", "process_env"}}
        });
    };

    auto lookup = [&process_env](const std::string& name) -> std::optional<std::string> {
        auto it = process_env.find(name);
        if (it == process_env.end()) return std::nullopt;
        return it->second;
    };

    if (auto v = lookup("MDEXPAND_MAX_FILE_SIZE")) {
        if (auto n = parse_unsigned(*v)) config.max_file_size = *n;
        else invalid("MDEXPAND_MAX_FILE_SIZE");
    }
    if (auto v = lookup("MDEXPAND_COMMAND_TIMEOUT_MS")) {
        auto n = parse_unsigned(*v);
        if (n && *n > 0 && *n <= 0x7fffffff) config.command_timeout_ms = static_cast<int>(*n);
        else invalid("MDEXPAND_COMMAND_TIMEOUT_MS");
    }
    if (auto v = lookup("MDEXPAND_CONCURRENCY")) {
        auto n = parse_unsigned(*v);
        if (n && *n > 0) config.concurrency_limit = static_cast<size_t>(*n);
        else invalid("MDEXPAND_CONCURRENCY");
    }
    if (auto v = lookup("MDEXPAND_MODEL")) {
        config.model = trim(*v);
    }
    if (auto v = lookup("MDEXPAND_CONTEXT_WINDOW")) {
        if (auto n = parse_unsigned(*v)) config.context_window = static_cast<size_t>(*n);
        else invalid("MDEXPAND_CONTEXT_WINDOW");
    }
    if (auto v = lookup("MDEXPAND_FORCE_CONTEXT")) {
        config.force_context = parse_flag(*v);
    }
    if (auto v = lookup("MDEXPAND_CACHE_DIR")) {
        if (!trim(*v).empty()) config.cache_dir = expand_tilde(trim(*v));
    }

    return warnings;
}

} // namespace mdexpand

/**
 * mdexpand CLI - Common utilities and types
 */

#pragma once

#include <mdexpand/mdexpand.hpp>
#include <mdexpand/log.hpp>
#include <mdexpand/platform.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace mdexpand::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config_path;       // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode,
                        const std::string& code = "") {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        if (!code.empty()) {
            j["code"] = code;
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_error(const Error& error, bool json_mode) {
    if (json_mode && !error.fields().empty()) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = error.message();
        j["code"] = error_code_to_string(error.code());
        j["details"] = error.fields();
        std::cout << j.dump(2) << std::endl;
        return;
    }
    print_error(error.message(), json_mode, error_code_to_string(error.code()));
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

inline nlohmann::json warnings_to_json(const std::vector<WarningObject>& warnings) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& w : warnings) {
        nlohmann::json entry;
        entry["key"] = w.key;
        entry["action"] = w.action;
        entry["fields"] = w.fields;
        arr.push_back(entry);
    }
    return arr;
}

/**
 * Read a document from a path, or from stdin when path is "-".
 */
inline std::optional<std::string> read_input(const std::string& path) {
    std::stringstream buffer;
    if (path == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    buffer << file.rdbuf();
    return buffer.str();
}

/**
 * Load configuration: defaults, then the config file, then MDEXPAND_* variables.
 * Problems found while loading are appended to `pending` so they can be emitted
 * once the warning policy is known. Returns nullopt after printing the error
 * when the config file is invalid.
 */
inline std::optional<Config> load_effective_config(const GlobalOptions& opts,
                                                   std::vector<WarningObject>& pending) {
    auto loaded = load_config(opts.config_path);
    if (!loaded.ok) {
        print_error(Error(ErrorCode::CONFIG_INVALID, loaded.error), opts.json);
        return std::nullopt;
    }

    const std::string prefix = "invalid_configuration:";
    for (const auto& w : loaded.warnings) {
        std::string reason = w.rfind(prefix, 0) == 0 ? w.substr(prefix.size()) : w;
        pending.push_back({warning_to_string(Warning::invalid_configuration), "warn",
                           warnings::invalid_configuration(reason, loaded.config.source_path)});
    }

    Config config = loaded.config;
    for (auto& w : apply_env_overrides(config, get_all_env())) {
        pending.push_back(std::move(w));
    }
    return config;
}

/**
 * Replay load-time problems through a collector that has the configured policy.
 */
inline void emit_pending(WarningCollector& collector, const std::vector<WarningObject>& pending) {
    for (const auto& w : pending) {
        collector.emit(w.key, w.fields);
    }
}

} // namespace mdexpand::cli

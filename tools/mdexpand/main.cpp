/**
 * mdexpand CLI - Entry Point
 *
 * Expand file, URL and command imports in markdown documents.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace mdexpand::cli::commands {
    void setup_expand(CLI::App* app, GlobalOptions& opts);
    void setup_parse(CLI::App* app, GlobalOptions& opts);
    void setup_cache(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace mdexpand::cli;

    CLI::App app{"mdexpand - expand imports in markdown documents"};
    app.set_version_flag("-V,--version", MDEXPAND_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config_path, "Config file (default: ~/.mdexpand/config.json)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    // Commands
    auto* expand_cmd = app.add_subcommand("expand", "Expand imports in a document");
    commands::setup_expand(expand_cmd, opts);

    auto* parse_cmd = app.add_subcommand("parse", "List the imports in a document");
    commands::setup_parse(parse_cmd, opts);

    auto* cache_cmd = app.add_subcommand("cache", "Manage the URL cache");
    commands::setup_cache(cache_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}

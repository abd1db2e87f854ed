/**
 * mdexpand CLI - expand command
 *
 * Expand every import in a document and print the result.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <memory>

namespace mdexpand::cli::commands {

namespace {

struct ExpandOptions {
    std::string input;
    std::vector<std::string> vars;
    std::string cwd;
    bool dry_run = false;
    bool no_cache = false;
    bool force_context = false;
    size_t concurrency = 0;
    int timeout_ms = 0;
    std::string phase = "all";
};

// "name=value" pairs; returns the first malformed entry, if any
std::optional<std::string> parse_vars(const std::vector<std::string>& raw,
                                      std::unordered_map<std::string, std::string>& out) {
    for (const auto& entry : raw) {
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            return entry;
        }
        out[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    return std::nullopt;
}

Result<std::string> run_phases(const std::string& text,
                               const std::string& doc_dir,
                               const ImportStack& stack,
                               const ResolutionContext& ctx,
                               const std::string& phase) {
    if (phase == "command") {
        return expand_command_imports(text, doc_dir, ctx)
            .map([](const std::string& s) { return strip_raw_markers(s); });
    }

    auto content = expand_content_imports(text, doc_dir, stack, ctx);
    if (content.isErr() || phase == "content") {
        return content;
    }

    std::vector<std::string> missing;
    std::string substituted = substitute(content.value(), ctx.template_vars, missing);
    for (const auto& name : missing) {
        spdlog::debug("No value for template variable: {}", name);
    }

    return expand_command_imports(substituted, doc_dir, ctx)
        .map([](const std::string& s) { return strip_raw_markers(s); });
}

int cmd_expand(const GlobalOptions& opts, const ExpandOptions& expand_opts) {
    setup_logging(opts.verbose, opts.quiet);

    std::vector<WarningObject> pending;
    auto config = load_effective_config(opts, pending);
    if (!config) {
        return 1;
    }

    if (expand_opts.concurrency > 0) config->concurrency_limit = expand_opts.concurrency;
    if (expand_opts.timeout_ms > 0) config->command_timeout_ms = expand_opts.timeout_ms;
    if (expand_opts.force_context) config->force_context = true;
    if (expand_opts.no_cache) config->no_cache = true;

    WarningCollector collector(config->warnings);
    emit_pending(collector, pending);

    std::unordered_map<std::string, std::string> vars;
    if (auto bad = parse_vars(expand_opts.vars, vars)) {
        print_error("Invalid --var (expected name=value): " + *bad, opts.json);
        return 1;
    }

    auto text = read_input(expand_opts.input);
    if (!text) {
        print_error(Error(ErrorCode::IO_ERROR, "Cannot read input: " + expand_opts.input,
                          {{"path", expand_opts.input}}),
                    opts.json);
        return 1;
    }

    // The document itself is the first entry of the cycle guard
    ImportStack stack;
    std::string doc_dir = current_directory();
    if (expand_opts.input != "-") {
        std::string input_path = join_path(current_directory(), expand_opts.input);
        doc_dir = get_parent_directory(input_path);
        stack = stack.extended(canonical_path(input_path).value_or(input_path));
    }

    HostEnvironment host(std::make_unique<DiskRemoteCache>(
        config->cache_dir, config->cache_ttl_ms, config->no_cache));
    ImportAccumulator imported;

    ResolutionContext ctx;
    ctx.env = get_all_env();
    ctx.imported = &imported;
    ctx.invocation_cwd = expand_opts.cwd.empty()
        ? current_directory()
        : join_path(current_directory(), expand_opts.cwd);
    ctx.template_vars = vars;
    ctx.dry_run = expand_opts.dry_run;
    ctx.config = *config;
    ctx.warnings = &collector;
    ctx.system = &host;

    auto result = run_phases(*text, doc_dir, stack, ctx, expand_opts.phase);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    if (collector.has_errors()) {
        for (const auto& w : collector.get_warnings()) {
            if (w.action == "error") {
                print_error("Warning escalated to error: " + w.key, opts.json, w.key);
                break;
            }
        }
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["output"] = result.value();
        j["imports"] = imported.entries();
        j["warnings"] = warnings_to_json(collector.get_warnings());
        output_json(j);
    } else {
        std::cout << result.value();
        if (!result.value().empty() && result.value().back() != '\n') {
            std::cout << std::endl;
        }
    }
    return 0;
}

} // namespace

void setup_expand(CLI::App* app, GlobalOptions& opts) {
    static ExpandOptions expand_opts;

    app->add_option("file", expand_opts.input, "Document to expand ('-' for stdin)")->required();
    app->add_option("--var", expand_opts.vars, "Template variable as name=value (repeatable)");
    app->add_option("--cwd", expand_opts.cwd, "Working directory for commands");
    app->add_flag("--dry-run", expand_opts.dry_run, "Show commands instead of running them");
    app->add_flag("--no-cache", expand_opts.no_cache, "Always fetch URLs");
    app->add_option("--concurrency", expand_opts.concurrency, "Concurrent resolutions per level");
    app->add_option("--timeout-ms", expand_opts.timeout_ms, "Command timeout in milliseconds");
    app->add_flag("--force-context", expand_opts.force_context, "Allow globs over the token limit");
    app->add_option("--phase", expand_opts.phase, "Which imports to expand")
        ->check(CLI::IsMember({"content", "command", "all"}));

    app->callback([&opts]() { std::exit(cmd_expand(opts, expand_opts)); });
}

} // namespace mdexpand::cli::commands

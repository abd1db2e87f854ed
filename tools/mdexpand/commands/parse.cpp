/**
 * mdexpand CLI - parse command
 *
 * List the directives found in a document without resolving them.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <type_traits>

namespace mdexpand::cli::commands {

namespace {

struct ParseOptions {
    std::string input;
};

nlohmann::json action_to_json(const ImportAction& action) {
    nlohmann::json j;
    j["type"] = action_type_to_string(action_type(action));
    j["index"] = source_index(action);
    j["original"] = original_text(action);

    std::visit([&j](const auto& a) {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, FileImport>) {
            j["path"] = a.path;
            if (a.line_range) {
                j["line_range"] = {{"start", a.line_range->start}, {"end", a.line_range->end}};
            }
        } else if constexpr (std::is_same_v<T, SymbolImport>) {
            j["path"] = a.path;
            j["symbol"] = a.symbol;
        } else if constexpr (std::is_same_v<T, GlobImport>) {
            j["pattern"] = a.pattern;
        } else if constexpr (std::is_same_v<T, UrlImport>) {
            j["url"] = a.url;
        } else if constexpr (std::is_same_v<T, CommandImport>) {
            j["command"] = a.command;
        } else {
            j["language"] = a.language;
            j["shebang"] = a.shebang;
            j["code"] = a.code;
        }
    }, action);

    return j;
}

std::string describe(const nlohmann::json& j) {
    if (j.contains("symbol")) return j["path"].get<std::string>() + " #" + j["symbol"].get<std::string>();
    if (j.contains("line_range")) {
        return j["path"].get<std::string>() + " lines " +
               std::to_string(j["line_range"]["start"].get<int>()) + "-" +
               std::to_string(j["line_range"]["end"].get<int>());
    }
    if (j.contains("path")) return j["path"].get<std::string>();
    if (j.contains("pattern")) return j["pattern"].get<std::string>();
    if (j.contains("url")) return j["url"].get<std::string>();
    if (j.contains("command")) return j["command"].get<std::string>();
    return j["language"].get<std::string>() + " " + j["shebang"].get<std::string>();
}

int cmd_parse(const GlobalOptions& opts, const ParseOptions& parse_opts) {
    setup_logging(opts.verbose, opts.quiet);

    auto text = read_input(parse_opts.input);
    if (!text) {
        print_error(Error(ErrorCode::IO_ERROR, "Cannot read input: " + parse_opts.input,
                          {{"path", parse_opts.input}}),
                    opts.json);
        return 1;
    }

    auto actions = parse_imports(*text);

    nlohmann::json list = nlohmann::json::array();
    for (const auto& action : actions) {
        list.push_back(action_to_json(action));
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["actions"] = list;
        output_json(j);
        return 0;
    }

    if (list.empty()) {
        std::cout << "No imports found" << std::endl;
        return 0;
    }

    for (const auto& entry : list) {
        std::cout << entry["index"].get<size_t>() << "  " << entry["type"].get<std::string>()
                  << "  " << describe(entry) << std::endl;
    }
    return 0;
}

} // namespace

void setup_parse(CLI::App* app, GlobalOptions& opts) {
    static ParseOptions parse_opts;

    app->add_option("file", parse_opts.input, "Document to scan ('-' for stdin)")->required();

    app->callback([&opts]() { std::exit(cmd_parse(opts, parse_opts)); });
}

} // namespace mdexpand::cli::commands

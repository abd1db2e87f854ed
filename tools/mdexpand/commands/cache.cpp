/**
 * mdexpand CLI - cache command
 *
 * Inspect and clear the URL cache.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace mdexpand::cli::commands {

namespace {

struct CacheOptions {
    bool expired_only = false;
};

std::optional<DiskRemoteCache> open_cache(const GlobalOptions& opts) {
    std::vector<WarningObject> pending;
    auto config = load_effective_config(opts, pending);
    if (!config) {
        return std::nullopt;
    }
    WarningCollector collector(config->warnings);
    emit_pending(collector, pending);
    return DiskRemoteCache(config->cache_dir, config->cache_ttl_ms);
}

int cmd_cache_clear(const GlobalOptions& opts, const CacheOptions& cache_opts) {
    setup_logging(opts.verbose, opts.quiet);

    auto cache = open_cache(opts);
    if (!cache) {
        return 1;
    }

    size_t removed = cache_opts.expired_only ? cache->clear_expired() : cache->clear_all();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["removed"] = removed;
        j["cache_dir"] = cache->dir();
        output_json(j);
    } else if (!opts.quiet) {
        std::cout << "Removed " << removed << (cache_opts.expired_only ? " expired" : "")
                  << " cache entr" << (removed == 1 ? "y" : "ies") << " from " << cache->dir()
                  << std::endl;
    }
    return 0;
}

int cmd_cache_stats(const GlobalOptions& opts) {
    setup_logging(opts.verbose, opts.quiet);

    auto cache = open_cache(opts);
    if (!cache) {
        return 1;
    }

    CacheStats stats = cache->stats();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["cache_dir"] = cache->dir();
        j["entries"] = stats.entries;
        j["total_bytes"] = stats.total_bytes;
        j["oldest_fetch"] = stats.oldest_fetch ? nlohmann::json(format_timestamp(*stats.oldest_fetch))
                                               : nlohmann::json(nullptr);
        j["newest_fetch"] = stats.newest_fetch ? nlohmann::json(format_timestamp(*stats.newest_fetch))
                                               : nlohmann::json(nullptr);
        output_json(j);
        return 0;
    }

    std::cout << "URL Cache" << std::endl;
    std::cout << "  Directory: " << cache->dir() << std::endl;
    std::cout << "  Entries: " << stats.entries << std::endl;
    std::cout << "  Size: " << format_bytes(stats.total_bytes) << std::endl;
    if (stats.oldest_fetch) {
        std::cout << "  Oldest: " << format_timestamp(*stats.oldest_fetch) << std::endl;
    }
    if (stats.newest_fetch) {
        std::cout << "  Newest: " << format_timestamp(*stats.newest_fetch) << std::endl;
    }
    return 0;
}

} // namespace

void setup_cache(CLI::App* app, GlobalOptions& opts) {
    static CacheOptions cache_opts;

    app->require_subcommand(1);

    auto* clear_cmd = app->add_subcommand("clear", "Remove cached URL content");
    clear_cmd->add_flag("--expired", cache_opts.expired_only, "Only remove expired entries");
    clear_cmd->callback([&opts]() { std::exit(cmd_cache_clear(opts, cache_opts)); });

    auto* stats_cmd = app->add_subcommand("stats", "Show cache size and age");
    stats_cmd->callback([&opts]() { std::exit(cmd_cache_stats(opts)); });
}

} // namespace mdexpand::cli::commands

#include "mdexpand/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace mdexpand {

namespace {

std::shared_ptr<spdlog::logger> create_logger() {
    auto existing = spdlog::get("mdexpand");
    if (existing) return existing;
    auto log = spdlog::stderr_color_mt("mdexpand");
    log->set_pattern("[%^%l%$] %v");
    return log;
}

} // namespace

void setup_logging(bool verbose, bool quiet) {
    auto log = create_logger();
    spdlog::set_default_logger(log);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

std::shared_ptr<spdlog::logger> logger() {
    return spdlog::default_logger();
}

} // namespace mdexpand

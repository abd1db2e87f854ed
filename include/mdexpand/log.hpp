#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace mdexpand {

// Install the "mdexpand" stderr logger as the spdlog default.
// verbose -> debug, quiet -> errors only, otherwise info.
void setup_logging(bool verbose, bool quiet);

std::shared_ptr<spdlog::logger> logger();

} // namespace mdexpand

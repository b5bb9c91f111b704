#pragma once

// Logging goes through spdlog. Library code only emits, executables own the sinks and the level.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace h2rpc {

namespace log = spdlog;

}  // namespace h2rpc

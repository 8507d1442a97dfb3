#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace lspc {

/// Library logger. Defaults to a stderr sink named "lspc" so that stdout
/// stays available to a caller speaking its own protocol there.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Replace the library logger. Passing nullptr restores the default.
void set_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace lspc

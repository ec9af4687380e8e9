#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace libinject::internal {

/// Library-wide logger, shorthand for get_logger().
std::shared_ptr<spdlog::logger> log();

/// True when the current logger would emit at `level`.  Call sites that
/// build message arguments check this first.
bool log_enabled(spdlog::level::level_enum level);

} // namespace libinject::internal

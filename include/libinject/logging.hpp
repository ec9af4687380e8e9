#pragma once

#include "export.hpp"

#include <memory>

namespace spdlog {
class logger;
}

namespace libinject {

/// Replace the library logger.  Passing nullptr restores the default,
/// which discards everything.
LIBINJECT_EXPORT void set_logger(std::shared_ptr<spdlog::logger> logger);

/// The logger currently in use.  Never null.
LIBINJECT_EXPORT std::shared_ptr<spdlog::logger> get_logger();

} // namespace libinject

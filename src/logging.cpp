#include "libinject/logging.hpp"
#include "logging_internal.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <utility>

namespace libinject {

namespace {

constexpr const char* const LOGGER_NAME = "libinject";

std::shared_ptr<spdlog::logger> make_default_logger() {
    auto logger = std::make_shared<spdlog::logger>(
        LOGGER_NAME, std::make_shared<spdlog::sinks::null_sink_mt>());
    logger->set_level(spdlog::level::off);
    return logger;
}

std::atomic<std::shared_ptr<spdlog::logger>>& slot() {
    static std::atomic<std::shared_ptr<spdlog::logger>> instance{make_default_logger()};
    return instance;
}

} // namespace

void set_logger(std::shared_ptr<spdlog::logger> logger) {
    slot().store(logger ? std::move(logger) : make_default_logger(),
                 std::memory_order_release);
}

std::shared_ptr<spdlog::logger> get_logger() {
    return slot().load(std::memory_order_acquire);
}

namespace internal {

std::shared_ptr<spdlog::logger> log() {
    return get_logger();
}

bool log_enabled(spdlog::level::level_enum level) {
    return slot().load(std::memory_order_acquire)->should_log(level);
}

} // namespace internal

} // namespace libinject

#include "svcdi/logging.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <memory>
#include <utility>

namespace svcdi {

namespace {

// Read on every resolve; atomic so logging never serialises resolvers.
std::atomic<std::shared_ptr<spdlog::logger>>& logger_slot() {
    static std::atomic<std::shared_ptr<spdlog::logger>> logger;
    return logger;
}

} // namespace

void set_logger(std::shared_ptr<spdlog::logger> logger) {
    logger_slot().store(std::move(logger));
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (auto logger = logger_slot().load()) return logger;
    return spdlog::default_logger();
}

} // namespace svcdi

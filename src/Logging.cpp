/**
 * @file Logging.cpp
 * @brief Logger registration
 */

#include "structdiff/Logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace structdiff {

std::shared_ptr<spdlog::logger> logger() {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);

    auto existing = spdlog::get(kLoggerName);
    if (existing) {
        return existing;
    }

    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    return created;
}

} // namespace structdiff

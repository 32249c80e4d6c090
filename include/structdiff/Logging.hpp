/**
 * @file Logging.hpp
 * @brief Process-wide logger for structdiff
 */

#ifndef STRUCTDIFF_LOGGING_HPP
#define STRUCTDIFF_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>

namespace structdiff {

/// Name under which the logger is registered with spdlog.
constexpr const char* kLoggerName = "structdiff";

/**
 * @brief Get the structdiff logger
 *
 * Returns the logger registered as "structdiff". If nobody registered one
 * (e.g. a test installing its own sink), a stderr color logger at warn
 * level is created and registered on first use.
 */
std::shared_ptr<spdlog::logger> logger();

} // namespace structdiff

#endif // STRUCTDIFF_LOGGING_HPP

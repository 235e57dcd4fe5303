#pragma once

/**
 * @file Logger.h
 * @brief Library logger (spdlog)
 *
 * All modules log through one named logger, "ChtVision", writing to stderr.
 * The logger is created on first use and is thread-safe.
 *
 * Usage:
 * @code
 * Platform::SetLogLevel(Platform::LogLevel::Debug);
 * Platform::GetLogger()->debug("edge pixels: {}", count);
 * @endcode
 */

#include <ChtVision/Core/Export.h>

#include <memory>

#include <spdlog/spdlog.h>

namespace Cht::Vision::Platform {

/// Name under which the logger is registered with spdlog
constexpr const char* LOGGER_NAME = "ChtVision";

/**
 * @brief Log severity, mapped onto spdlog levels
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,      ///< Default
    Error,
    Off
};

/**
 * @brief Get the library logger (created on first call)
 */
CHTVISION_API std::shared_ptr<spdlog::logger> GetLogger();

/**
 * @brief Set minimum severity of emitted messages
 */
CHTVISION_API void SetLogLevel(LogLevel level);

/**
 * @brief Get current minimum severity
 */
CHTVISION_API LogLevel GetLogLevel();

} // namespace Cht::Vision::Platform

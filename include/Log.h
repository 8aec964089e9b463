#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "Export.h"

namespace SnAPI::StateSync
{

/**
 * @brief Logging configuration applied by ConfigureLogging.
 */
struct LogSettings
{
    spdlog::level::level_enum Level = spdlog::level::info; /**< @brief Minimum level for every state sync logger. */
    bool ConsoleEnabled = true; /**< @brief Emit to a colored stdout sink. */
    bool FileEnabled = false; /**< @brief Emit to a rotating file sink under LogDirectory. */
    std::string LogDirectory{}; /**< @brief Directory for file sinks; ignored when FileEnabled is false. */
    std::size_t MaxFileSize = 10 * 1024 * 1024; /**< @brief Rotation size of file sinks in bytes. */
    std::size_t MaxFiles = 3; /**< @brief Rotated file count kept on disk. */
};

/**
 * @brief Apply logging settings to all existing and future loggers.
 */
SNAPI_STATESYNC_API void ConfigureLogging(const LogSettings& Settings);

/**
 * @brief Get or create a named logger.
 * @param Name Logger name shown in the [%n] pattern field.
 * @remarks Loggers are created with the sinks of the current LogSettings and
 * registered with spdlog.
 */
SNAPI_STATESYNC_API std::shared_ptr<spdlog::logger> GetLogger(const std::string& Name);

/**
 * @brief Logger used by the core ("StateSync").
 */
SNAPI_STATESYNC_API std::shared_ptr<spdlog::logger> CoreLogger();

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "off").
 * @return Parsed level, or info for unknown names.
 */
SNAPI_STATESYNC_API spdlog::level::level_enum ParseLogLevel(std::string_view Name);

} // namespace SnAPI::StateSync

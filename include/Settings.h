#pragma once

#include <cstdint>

#include "Log.h"
#include "Math.h"
#include "StateSaveTypes.h"

namespace SnAPI::StateSync
{

/**
 * @brief Runtime configuration for a StateSyncRuntime.
 * @remarks Applied once by StateSyncRuntime::Initialize. Values are read by
 * the dispatcher, the save implementers and the orchestrator through the
 * runtime that owns them.
 */
struct StateSyncSettings
{
    /**
     * @brief Raise ComponentStateChanged only for top-level sync calls.
     * @remarks When false, nested BeginSync/EndSync pairs notify as well.
     */
    bool UseTopLevelStateChangesOnly = true;
    int SyncCallDepthErrorThreshold = 100; /**< @brief Depth at which BeginSync reports a missing EndSync. */
    float FloatPrecisionThreshold = kDefaultPrecisionThreshold; /**< @brief Change-detection threshold for floating point fields. */
    uint16_t BinaryVersion = kCurrentBinaryVersion; /**< @brief Version written into stream headers and sync events. */
    LogSettings Log{}; /**< @brief Logging configuration applied on initialize. */
    bool ConfigureLoggingOnInitialize = true; /**< @brief Apply Log through ConfigureLogging during Initialize. */
};

} // namespace SnAPI::StateSync

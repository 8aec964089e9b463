#pragma once

#include <cstdint>
#include <string_view>

#include "Flags.h"

namespace SnAPI::StateSync
{

/**
 * @brief Current binary format version written into every stream header.
 * @remarks Bump whenever any participant changes its wire layout. Readers
 * accept any version up to their own and branch on it for optional fields.
 */
inline constexpr uint16_t kCurrentBinaryVersion = 1;

/**
 * @brief Stream format byte (header byte 0).
 */
enum class ESerializationFormat : uint8_t
{
    Uncompressed = 0,   /**< @brief Records follow the header as-is. */
    GzipCompressed = 1  /**< @brief Everything after the header is a gzip stream. */
};

/**
 * @brief Fidelity of a save (header byte 1 for the first two values).
 */
enum class EStateSaveLevel : uint8_t
{
    ChangesSincePreviousSave = 0, /**< @brief Only fields that differ from the last save baseline. */
    Complete = 1,                 /**< @brief Every tracked field. */
    ChangesSinceBeginning = 2     /**< @brief Fields that differ from the initial baseline. Used in-process to capture that baseline. */
};

/**
 * @brief Behaviour switches for a single SerializeState call.
 */
enum class EStateSaveOption : uint32_t
{
    None = 0,
    DontSerialize = 1u << 0,     /**< @brief Run change detection only; read or write no bytes. */
    DontCacheChanges = 1u << 1,  /**< @brief Do not update the last-saved baseline. */
    DontCheckCache = 1u << 2,    /**< @brief Treat every value as changed. */
    ResetChangesCache = 1u << 3, /**< @brief Overwrite both baselines with the current values. */
    FirstFrame = 1u << 4         /**< @brief Call made while capturing the initial baseline. */
};
SNAPI_STATESYNC_DECLARE_FLAGS(EStateSaveOption)

using StateSaveOptions = TFlags<EStateSaveOption>;

/**
 * @brief Precedence class of a participant in registry enumeration.
 * @remarks Lower tiers are saved and loaded first so that dependent objects
 * find their singletons already restored.
 */
enum class EStateSaveTier : uint8_t
{
    GlobalState = 0, /**< @brief The single global-state participant (e.g. the instance manager). */
    Singleton = 1,   /**< @brief Other process-wide singletons. */
    Component = 2    /**< @brief Everything else. */
};

constexpr std::string_view ToString(ESerializationFormat Format)
{
    switch (Format)
    {
    case ESerializationFormat::Uncompressed: return "Uncompressed";
    case ESerializationFormat::GzipCompressed: return "GzipCompressed";
    }
    return "Unknown";
}

constexpr std::string_view ToString(EStateSaveLevel Level)
{
    switch (Level)
    {
    case EStateSaveLevel::ChangesSincePreviousSave: return "ChangesSincePreviousSave";
    case EStateSaveLevel::Complete: return "Complete";
    case EStateSaveLevel::ChangesSinceBeginning: return "ChangesSinceBeginning";
    }
    return "Unknown";
}

} // namespace SnAPI::StateSync

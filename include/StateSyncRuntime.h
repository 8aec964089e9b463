#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "Expected.h"
#include "Export.h"
#include "Settings.h"
#include "StateSaveOrchestrator.h"
#include "StateSaveRegistry.h"
#include "StateSyncDispatcher.h"
#include "UniqueIdRegistry.h"

namespace SnAPI::StateSync
{

class ISceneHost;

/**
 * @brief Composition root of the state sync core.
 * @remarks
 * Owns the settings and every service built on them:
 * - `UniqueIdRegistry` for id assignment and lookup
 * - `StateSaveRegistry` for participant bookkeeping
 * - `StateSyncDispatcher` for sync brackets and event replay
 * - `StateSaveOrchestrator` for save streams
 *
 * Services keep pointers into the runtime, so it is neither copyable nor
 * movable. Several runtimes can coexist; each is single-threaded.
 */
class SNAPI_STATESYNC_API StateSyncRuntime final
{
public:
    StateSyncRuntime();
    ~StateSyncRuntime();

    StateSyncRuntime(const StateSyncRuntime&) = delete;
    StateSyncRuntime& operator=(const StateSyncRuntime&) = delete;

    /**
     * @brief Apply settings.
     * @return InvalidArgument for a binary version of 0 or newer than this
     * build can read, or a non-positive depth threshold.
     * @remarks Configures logging when ConfigureLoggingOnInitialize is set.
     * Registered objects are kept.
     */
    Result Initialize(const StateSyncSettings& InSettings);

    bool IsInitialized() const
    {
        return m_initialized;
    }

    const StateSyncSettings& Settings() const
    {
        return m_settings;
    }

    /**
     * @brief Close the current frame: captures pending initial baselines.
     */
    void EndFrame();

    void SetSceneHost(ISceneHost* Host)
    {
        m_orchestrator.SetSceneHost(Host);
    }

    ISceneHost* SceneHost() const
    {
        return m_orchestrator.SceneHost();
    }

    /** @copydoc StateSaveOrchestrator::SaveStateChanges(EStateSaveLevel, ESerializationFormat) */
    TExpected<std::vector<uint8_t>> SaveStateChanges(EStateSaveLevel Level, ESerializationFormat Format = ESerializationFormat::Uncompressed)
    {
        return m_orchestrator.SaveStateChanges(Level, Format);
    }

    TExpected<std::vector<uint8_t>> SaveStateChanges(const std::optional<std::vector<Uuid>>& Roots,
                                                     std::span<const Uuid> IgnoreRoots,
                                                     EStateSaveLevel Level,
                                                     ESerializationFormat Format = ESerializationFormat::Uncompressed)
    {
        return m_orchestrator.SaveStateChanges(Roots, IgnoreRoots, Level, Format);
    }

    LoadReport LoadStateChanges(std::span<const uint8_t> Bytes)
    {
        return m_orchestrator.LoadStateChanges(Bytes);
    }

    StateSyncResult ExecuteStateSyncEvent(std::span<const uint8_t> Bytes)
    {
        return m_dispatcher.ExecuteStateSyncEvent(Bytes);
    }

    UniqueIdRegistry& UniqueIds()
    {
        return m_uniqueIds;
    }

    const UniqueIdRegistry& UniqueIds() const
    {
        return m_uniqueIds;
    }

    StateSaveRegistry& StateSaves()
    {
        return m_stateSaves;
    }

    const StateSaveRegistry& StateSaves() const
    {
        return m_stateSaves;
    }

    StateSyncDispatcher& Dispatcher()
    {
        return m_dispatcher;
    }

    const StateSyncDispatcher& Dispatcher() const
    {
        return m_dispatcher;
    }

    StateSaveOrchestrator& Orchestrator()
    {
        return m_orchestrator;
    }

private:
    StateSyncSettings m_settings{}; /**< @brief Active settings; services read them through a pointer. */
    UniqueIdRegistry m_uniqueIds{}; /**< @brief Id assignment and lookup. */
    StateSaveRegistry m_stateSaves{}; /**< @brief Participant bookkeeping. */
    StateSyncDispatcher m_dispatcher; /**< @brief Sync brackets and event replay. */
    StateSaveOrchestrator m_orchestrator; /**< @brief Save stream writer and reader. */
    bool m_initialized = false; /**< @brief Set by a successful Initialize. */
};

} // namespace SnAPI::StateSync

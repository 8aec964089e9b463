#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "Expected.h"
#include "Export.h"
#include "IStateSave.h"
#include "IStateSync.h"
#include "StateSaveImplementer.h"
#include "StateSyncDispatcher.h"
#include "SyncMethodTable.h"
#include "Uuid.h"

namespace SnAPI::StateSync
{

class StateSyncRuntime;

/**
 * @brief Base class for objects that take part in state save and state sync.
 * @remarks
 * Derived classes:
 * - describe their tracked fields in SerializeStateInternal through
 *   SerializeStateValue
 * - register replayable methods and property setters in SyncMethods() from
 *   their constructor
 * - bracket state-changing members with BeginSync and EndSyncMethod (or
 *   EndSyncProperty), or with a ScopedSync from MakeScopedSync
 *
 * Lifecycle: construct, then call Initialize once the object is fully
 * constructed (registration dry-runs SerializeState). SetEnabled keeps the
 * save registry informed. The destructor unregisters from both registries;
 * the runtime must outlive the component.
 */
class SNAPI_STATESYNC_API StateComponent : public IStateSave, public IStateSync
{
public:
    /**
     * @param InRuntime Runtime the component registers with.
     * @param InTypeName Stable type name used in logs and type-name ids.
     * @param InPath Stable scene path; empty for a random id.
     */
    StateComponent(StateSyncRuntime& InRuntime, std::string InTypeName, std::string InPath = {});
    ~StateComponent() override;

    StateComponent(const StateComponent&) = delete;
    StateComponent& operator=(const StateComponent&) = delete;

    /**
     * @brief Register with the id and save registries.
     * @param PreferredId Id to use instead of the derived one; nil to derive.
     * @return AlreadyExists for a second global-state participant. Calling
     * again after success is a no-op.
     */
    Result Initialize(const Uuid& PreferredId = {});

    /**
     * @brief Unregister from both registries. Called by the destructor.
     */
    void Shutdown();

    bool IsInitialized() const
    {
        return m_initialized;
    }

    void SetEnabled(bool Enabled);

    bool IsEnabled() const
    {
        return m_enabled;
    }

    const Uuid& UniqueId() const override
    {
        return m_id;
    }

    std::string_view UniqueTypeName() const override
    {
        return m_typeName;
    }

    std::string UniquePath() const override
    {
        return m_path;
    }

    /**
     * @brief Runs SerializeStateInternal between the implementer's state events.
     */
    bool SerializeState(ISerializer& Serializer, int32_t DeclaredVersion, EStateSaveLevel Level, StateSaveOptions Options) override;

    bool IsStateSaveEnabled() const override
    {
        return m_enabled;
    }

    /**
     * @brief Replay through the sync method table.
     */
    Result ApplySyncEvent(const SyncEventArgs& Args) override
    {
        return m_syncMethods.Apply(Args);
    }

    StateSaveImplementer& StateImplementer()
    {
        return m_state;
    }

    const SyncMethodTable& SyncMethods() const
    {
        return m_syncMethods;
    }

    StateSyncRuntime& Runtime() const
    {
        return *m_runtime;
    }

protected:
    /**
     * @brief Transfer this component's tracked fields.
     * @return True when any value was transferred.
     */
    virtual bool SerializeStateInternal(ISerializer& Serializer, int32_t DeclaredVersion, EStateSaveLevel Level, StateSaveOptions Options) = 0;

    template<typename T>
    bool SerializeStateValue(ISerializer& Serializer, EStateSaveLevel Level, StateSaveOptions Options, std::string_view Name, T& Value)
    {
        return m_state.SerializeStateValue(Serializer, Level, Options, Name, Value);
    }

    SyncMethodTable& SyncMethods()
    {
        return m_syncMethods;
    }

    void BeginSync(StateSyncOptions Options = EStateSyncOption::Default);
    void CancelSync();

    template<typename... Args>
    void EndSyncMethod(std::string MethodName, Args&&... Arguments)
    {
        Dispatcher().EndSyncMethod(*this, std::move(MethodName), std::forward<Args>(Arguments)...);
    }

    template<typename V>
    void EndSyncProperty(std::string PropertyName, V&& Value)
    {
        Dispatcher().EndSyncProperty(*this, std::move(PropertyName), std::forward<V>(Value));
    }

    StateSyncDispatcher::ScopedSync MakeScopedSync(StateSyncOptions Options = EStateSyncOption::Default)
    {
        return StateSyncDispatcher::ScopedSync(Dispatcher(), *this, Options);
    }

    /**
     * @brief True while a received event is being replayed on this runtime.
     */
    bool IsInsideStateSync() const;

    void AssignUniqueId(const Uuid& Id) override
    {
        m_id = Id;
    }

private:
    StateSyncDispatcher& Dispatcher() const;

    StateSyncRuntime* m_runtime = nullptr; /**< @brief Owning runtime; outlives the component. */
    std::string m_typeName{}; /**< @brief Stable type name. */
    std::string m_path{}; /**< @brief Stable scene path, may be empty. */
    Uuid m_id{}; /**< @brief Assigned by the id registry. */
    bool m_enabled = true; /**< @brief Current enabled state. */
    bool m_initialized = false; /**< @brief Registered with both registries. */
    StateSaveImplementer m_state; /**< @brief Baselines and change tracking. */
    SyncMethodTable m_syncMethods{}; /**< @brief Replayable members. */
};

} // namespace SnAPI::StateSync

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "Event.h"
#include "Expected.h"
#include "Export.h"
#include "IStateSync.h"
#include "Settings.h"
#include "SyncEvent.h"

namespace SnAPI::StateSync
{

class UniqueIdRegistry;

/**
 * @brief Outcome of replaying a serialized sync event.
 * @remarks Target and EventArgs are filled as far as decoding got, so a
 * failed replay still reports what it was trying to do.
 */
struct SNAPI_STATESYNC_API StateSyncResult
{
    IStateSync* Target = nullptr; /**< @brief Resolved target, if any. */
    std::optional<SyncEventArgs> EventArgs{}; /**< @brief Decoded call, if decoding succeeded. */
    std::string ErrorMessage{}; /**< @brief Empty on success. */
    EErrorCode ErrorCode = EErrorCode::None; /**< @brief Category of the failure. */

    bool IsError() const
    {
        return ErrorCode != EErrorCode::None;
    }

    std::string ToString() const;
};

/**
 * @brief Tracks nested sync calls and publishes top-level state changes.
 * @remarks
 * A state-changing member brackets its body with BeginSync and one of the
 * EndSync calls. The dispatcher counts the nesting depth and raises
 * ComponentStateChanged for a call only when it is the outermost one
 * (depth 1), unless the call asked for IgnoreNestingCheck or the settings
 * disable the top-level rule. Nothing is raised while a received event is
 * being replayed, so replays never echo back to the network.
 *
 * Use ScopedSync where the member can exit early or throw; it cancels the
 * bracket on every path that does not complete it.
 */
class SNAPI_STATESYNC_API StateSyncDispatcher
{
public:
    explicit StateSyncDispatcher(const StateSyncSettings& InSettings, const UniqueIdRegistry& InUniqueIds);

    StateSyncDispatcher(const StateSyncDispatcher&) = delete;
    StateSyncDispatcher& operator=(const StateSyncDispatcher&) = delete;

    /**
     * @brief Open a sync bracket.
     * @remarks Logs an error once the depth exceeds SyncCallDepthErrorThreshold,
     * which almost always means an EndSync is missing.
     */
    void BeginSync(StateSyncOptions Options = EStateSyncOption::Default);

    /**
     * @brief Close the innermost bracket without notifying.
     */
    void CancelSync();

    /**
     * @brief Close the innermost bracket for a method call.
     * @param Arguments Call arguments. Their decayed types must match the
     * registered method's parameter types exactly.
     */
    template<typename... Args>
    void EndSyncMethod(IStateSync& Target, std::string MethodName, Args&&... Arguments)
    {
        std::vector<Variant> Packed;
        Packed.reserve(sizeof...(Args));
        (Packed.push_back(Variant::FromValue<std::decay_t<Args>>(std::forward<Args>(Arguments))), ...);
        EndSyncState(Target, SyncEventArgs::Method(std::move(MethodName), std::move(Packed)));
    }

    /**
     * @brief Close the innermost bracket for a property assignment.
     */
    template<typename V>
    void EndSyncProperty(IStateSync& Target, std::string PropertyName, V&& Value)
    {
        EndSyncState(Target, SyncEventArgs::Property(std::move(PropertyName), Variant::FromValue<std::decay_t<V>>(std::forward<V>(Value))));
    }

    /**
     * @brief Close the innermost bracket with a prepared event.
     * @remarks The event receives the options of the matching BeginSync. The
     * depth is decremented even if a listener throws.
     */
    void EndSyncState(IStateSync& Target, SyncEventArgs Args);

    int SyncCallDepth() const
    {
        return m_depth;
    }

    /**
     * @brief True while ExecuteStateSyncEvent is replaying an event.
     */
    bool IsInsideStateSync() const
    {
        return m_insideStateSync;
    }

    /**
     * @brief Decode and replay a serialized event.
     * @remarks Never throws; failures are reported in the result and logged.
     */
    StateSyncResult ExecuteStateSyncEvent(std::span<const uint8_t> Bytes);

    /**
     * @brief Encode an event with the configured binary version.
     */
    TExpected<std::vector<uint8_t>> SerializeEvent(const IStateSync& Target, const SyncEventArgs& Args) const;

    /**
     * @brief RAII sync bracket.
     * @remarks Cancels on destruction unless one of the End calls was made.
     */
    class SNAPI_STATESYNC_API ScopedSync
    {
    public:
        ScopedSync(StateSyncDispatcher& InDispatcher, IStateSync& InTarget, StateSyncOptions Options = EStateSyncOption::Default);
        ~ScopedSync();

        ScopedSync(const ScopedSync&) = delete;
        ScopedSync& operator=(const ScopedSync&) = delete;

        template<typename... Args>
        void EndMethod(std::string MethodName, Args&&... Arguments)
        {
            if (Release())
            {
                m_dispatcher->EndSyncMethod(*m_target, std::move(MethodName), std::forward<Args>(Arguments)...);
            }
        }

        template<typename V>
        void EndProperty(std::string PropertyName, V&& Value)
        {
            if (Release())
            {
                m_dispatcher->EndSyncProperty(*m_target, std::move(PropertyName), std::forward<V>(Value));
            }
        }

        void Cancel();

    private:
        bool Release();

        StateSyncDispatcher* m_dispatcher = nullptr; /**< @brief Dispatcher the bracket was opened on. */
        IStateSync* m_target = nullptr; /**< @brief Object the bracket belongs to. */
        bool m_open = false; /**< @brief True until ended or cancelled. */
    };

    /**
     * @brief Raised for every propagated state change: (target, event).
     */
    TMulticastEvent<IStateSync&, const SyncEventArgs&> ComponentStateChanged;

private:
    bool ShouldNotify(StateSyncOptions Options) const;

    const StateSyncSettings* m_settings = nullptr; /**< @brief Settings of the owning runtime. */
    const UniqueIdRegistry* m_uniqueIds = nullptr; /**< @brief Registry used to resolve replay targets. */
    int m_depth = 0; /**< @brief Open sync brackets. */
    std::vector<StateSyncOptions> m_optionStack{}; /**< @brief Options of the open brackets, innermost last. */
    bool m_insideStateSync = false; /**< @brief Set while replaying an event. */
};

} // namespace SnAPI::StateSync

#pragma once

#include <cstddef>
#include <unordered_set>
#include <vector>

#include "Expected.h"
#include "Export.h"
#include "IStateSave.h"
#include "StateSaveEvents.h"

namespace SnAPI::StateSync
{

/**
 * @brief Bookkeeping of state save participants.
 * @remarks
 * Lifecycle of a participant:
 * - Register: a dry run (Complete level, DontSerialize|DontCacheChanges,
 *   dummy write serializer) decides whether the participant ever produces
 *   data. Participants that do not are excluded for good; only Reconsider
 *   reconsiders them. The global-state participant never gets a dry run.
 * - NotifyEnabled / NotifyDisabled move the participant in and out of the
 *   enabled view, and of the save-required view unless it saves while
 *   disabled.
 * - Unregister removes it from every view.
 *
 * Views are ordered by tier (global state, singletons, components) and by
 * registration order within a tier. The save order key is applied by the
 * orchestrator, not here.
 *
 * Initial baselines are not captured at registration but in one batch by
 * NotifyEndOfFrame, so that every participant registered during a frame
 * shares the same consistent snapshot.
 */
class SNAPI_STATESYNC_API StateSaveRegistry
{
public:
    StateSaveRegistry() = default;
    StateSaveRegistry(const StateSaveRegistry&) = delete;
    StateSaveRegistry& operator=(const StateSaveRegistry&) = delete;

    /**
     * @brief Register a participant.
     * @return True when the participant was admitted, false when the dry run
     * excluded it. AlreadyExists when a second global-state participant is
     * registered.
     * @remarks Registering an admitted participant again is a no-op.
     */
    TExpected<bool> Register(IStateSave& Participant);

    /**
     * @brief Remove a participant from every view and the baseline queue.
     */
    void Unregister(IStateSave& Participant);

    void NotifyEnabled(IStateSave& Participant);
    void NotifyDisabled(IStateSave& Participant);

    /**
     * @brief Repeat the dry run for an excluded participant.
     * @return True when the participant is now admitted.
     * @remarks For participants whose tracked field set can change at runtime.
     */
    TExpected<bool> Reconsider(IStateSave& Participant);

    bool IsRegistered(const IStateSave& Participant) const;
    bool IsExcluded(const IStateSave& Participant) const;
    bool IsEnabled(const IStateSave& Participant) const;

    /**
     * @brief Global-state participant, or nullptr.
     */
    IStateSave* GlobalState() const
    {
        return m_globalState;
    }

    std::vector<IStateSave*> AllParticipants() const;
    std::vector<IStateSave*> EnabledParticipants() const;

    /**
     * @brief Enabled participants plus those that save while disabled.
     */
    std::vector<IStateSave*> SaveRequiredParticipants() const;

    /**
     * @brief Capture initial baselines of every participant registered since the last call.
     * @remarks Failures are logged per participant.
     */
    void NotifyEndOfFrame();

    std::size_t PendingBaselineCount() const
    {
        return m_pendingBaselines.size();
    }

    StateSaveEvents Events{}; /**< @brief Inspection events shared by every implementer of this registry. */

private:
    struct TierViews
    {
        std::vector<IStateSave*> All{}; /**< @brief Admitted participants. */
        std::vector<IStateSave*> Enabled{}; /**< @brief Admitted and enabled. */
        std::vector<IStateSave*> SaveRequired{}; /**< @brief Enabled or saved while disabled. */
    };

    TExpected<bool> Admit(IStateSave& Participant);
    bool ProducesState(IStateSave& Participant) const;
    TierViews* ViewsFor(const IStateSave& Participant);
    const TierViews* ViewsFor(const IStateSave& Participant) const;
    std::vector<IStateSave*> Collect(std::vector<IStateSave*> TierViews::*View, bool IncludeGlobal) const;

    IStateSave* m_globalState = nullptr; /**< @brief Global-state participant (no dry run). */
    TierViews m_singletons{}; /**< @brief Singleton tier views. */
    TierViews m_components{}; /**< @brief Component tier views. */
    std::unordered_set<const IStateSave*> m_excluded{}; /**< @brief Participants whose dry run produced no data. */
    std::vector<IStateSave*> m_pendingBaselines{}; /**< @brief Participants waiting for NotifyEndOfFrame. */
};

} // namespace SnAPI::StateSync

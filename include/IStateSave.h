#pragma once

#include <cstdint>

#include "DummySerializer.h"
#include "Export.h"
#include "Serializer.h"
#include "StateSaveTypes.h"
#include "UniqueId.h"

namespace SnAPI::StateSync
{

/**
 * @brief Capability of objects whose state can be saved, loaded and replayed.
 * @remarks
 * A participant describes its tracked fields once in SerializeState, for both
 * directions. The same call serves full snapshots, incremental saves, dry-run
 * dry runs and baseline capture; the level and options select the behaviour.
 *
 * Participants are registered with a StateSaveRegistry, which decides when
 * they are enumerated for saving.
 */
class SNAPI_STATESYNC_API IStateSave : public virtual IUniqueId
{
public:
    /**
     * @brief Serialize the tracked state of this participant.
     * @param Serializer Serializer to read from or write to.
     * @param DeclaredVersion Participant state version stored in the record
     * (StateSerializationVersion() when writing).
     * @param Level Save fidelity.
     * @param Options Behaviour switches.
     * @return True if any value was (or, with DontSerialize, would be) transferred.
     * @throws SerializationException on malformed input.
     */
    virtual bool SerializeState(ISerializer& Serializer, int32_t DeclaredVersion, EStateSaveLevel Level, StateSaveOptions Options) = 0;

    /**
     * @brief Whether the participant currently counts as enabled.
     */
    virtual bool IsStateSaveEnabled() const = 0;

    /**
     * @brief Version of this participant's field layout.
     */
    virtual int32_t StateSerializationVersion() const
    {
        return 0;
    }

    /**
     * @brief Sort key for save order within a tier. Lower values are saved and loaded first.
     */
    virtual int32_t SerializationOrder() const
    {
        return 0;
    }

    /**
     * @brief Save this participant even while it is disabled.
     */
    virtual bool SaveStateWhenDisabled() const
    {
        return false;
    }

    /**
     * @brief Include the enabled flag in saved state.
     * @remarks Loading a differing flag enables or disables the participant.
     */
    virtual bool SerializeEnabledState() const
    {
        return false;
    }

    virtual EStateSaveTier StateSaveTier() const
    {
        return EStateSaveTier::Component;
    }

    /**
     * @brief True for objects whose world position must be re-applied after a load.
     */
    virtual bool IsSpatialAnchor() const
    {
        return false;
    }

    /**
     * @brief Capture the current values as the initial and last-saved baselines.
     * @remarks Runs SerializeState through a DummySerializer, so nothing is
     * written. Called by the registry in its end-of-frame batch.
     */
    virtual void StoreInitialState()
    {
        DummySerializer Serializer;
        SerializeState(Serializer, StateSerializationVersion(), EStateSaveLevel::ChangesSinceBeginning,
            EStateSaveOption::DontSerialize | EStateSaveOption::ResetChangesCache | EStateSaveOption::FirstFrame);
    }
};

} // namespace SnAPI::StateSync

#pragma once

#include "Expected.h"
#include "Export.h"
#include "SyncEvent.h"
#include "UniqueId.h"

namespace SnAPI::StateSync
{

/**
 * @brief Capability of objects that emit and replay sync events.
 * @remarks Replaying an event on a target in the same state must perform the
 * same state transition as the original call.
 */
class SNAPI_STATESYNC_API IStateSync : public virtual IUniqueId
{
public:
    /**
     * @brief Replay a captured call on this object.
     * @return NotFound for unknown members, InvalidArgument or TypeMismatch for
     * argument mismatches, InvokeFailed when the member throws.
     */
    virtual Result ApplySyncEvent(const SyncEventArgs& Args) = 0;
};

} // namespace SnAPI::StateSync

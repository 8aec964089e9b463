#pragma once

#include <vector>

#include "Export.h"
#include "Uuid.h"

namespace SnAPI::StateSync
{

class IStateSave;

/**
 * @brief Scene graph services the state sync core needs from its host.
 * @remarks Implemented by the engine integration. Roots are addressed by
 * the unique id of the root object.
 */
class SNAPI_STATESYNC_API ISceneHost
{
public:
    virtual ~ISceneHost() = default;

    /**
     * @brief Participants at or below a root, in hierarchy order.
     * @param IncludeDisabled Also return participants that are currently disabled.
     */
    virtual std::vector<IStateSave*> FindStateSavesUnder(const Uuid& RootId, bool IncludeDisabled) const = 0;

    /**
     * @brief True when the participant is the root or one of its descendants.
     */
    virtual bool IsDescendantOf(const IStateSave& Participant, const Uuid& RootId) const = 0;

    /**
     * @brief Move a loaded anchor to its current position through the regular
     * movement path, so movement listeners are notified.
     */
    virtual void ReapplyAnchorPosition(IStateSave& Participant) = 0;
};

} // namespace SnAPI::StateSync

#pragma once

#include <string>

#include "Event.h"
#include "StateSaveTypes.h"
#include "Variant.h"

namespace SnAPI::StateSync
{

class IStateSave;

/**
 * @brief Payload of the state save inspection events.
 * @remarks VarName, OldValue and NewValue are only set by the Var events.
 * The values are empty when the field type has no TTypeName.
 */
struct StateSaveEventArgs
{
    IStateSave* Participant = nullptr; /**< @brief Participant being serialized. */
    bool IsReading = false; /**< @brief Direction of the serializer. */
    EStateSaveLevel Level = EStateSaveLevel::Complete; /**< @brief Level of the call. */
    StateSaveOptions Options{}; /**< @brief Options of the call. */
    std::string VarName{}; /**< @brief Tracked field name. */
    Variant OldValue{}; /**< @brief Field value before the transfer. */
    Variant NewValue{}; /**< @brief Field value after the transfer (same as OldValue in the Serializing event). */
};

/**
 * @brief Events raised while participants serialize their state.
 * @remarks Owned by StateSaveRegistry and shared by every implementer
 * attached to it. Listeners are for tooling and diagnostics; they must not
 * mutate participant state.
 */
struct StateSaveEvents
{
    TMulticastEvent<const StateSaveEventArgs&> StateSerializing; /**< @brief Before a participant serializes its state. */
    TMulticastEvent<const StateSaveEventArgs&> StateSerialized; /**< @brief After a participant serialized its state. */
    TMulticastEvent<const StateSaveEventArgs&> VarSerializing; /**< @brief Before a changed field is transferred. */
    TMulticastEvent<const StateSaveEventArgs&> VarSerialized; /**< @brief After a changed field was transferred. */
};

} // namespace SnAPI::StateSync

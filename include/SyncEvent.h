#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "Expected.h"
#include "Export.h"
#include "Flags.h"
#include "StateSaveTypes.h"
#include "UniqueId.h"
#include "Uuid.h"
#include "Variant.h"

namespace SnAPI::StateSync
{

class IStateSync;
class UniqueIdRegistry;

/**
 * @brief Routing hints attached to a sync call by BeginSync.
 */
enum class EStateSyncOption : uint32_t
{
    None = 0,
    Network = 1u << 0,            /**< @brief Send the change to remote peers. */
    Replay = 1u << 1,             /**< @brief Record the change for replays. */
    GenerateNewFrame = 1u << 8,   /**< @brief Start a new replay frame for this change. */
    IgnoreNestingCheck = 1u << 9, /**< @brief Notify even when nested inside another sync call. */
    Default = Network | Replay
};
SNAPI_STATESYNC_DECLARE_FLAGS(EStateSyncOption)

using StateSyncOptions = TFlags<EStateSyncOption>;

enum class ESyncEventKind : uint8_t
{
    MethodInvoked = 0,  /**< @brief A sync method was called with Args. */
    PropertyChanged = 1 /**< @brief A sync property was set to Args[0]. */
};

constexpr std::string_view ToString(ESyncEventKind Kind)
{
    switch (Kind)
    {
    case ESyncEventKind::MethodInvoked: return "MethodInvoked";
    case ESyncEventKind::PropertyChanged: return "PropertyChanged";
    }
    return "Unknown";
}

/**
 * @brief A captured state-changing call.
 * @remarks Options are local routing hints and do not travel on the wire.
 */
struct SNAPI_STATESYNC_API SyncEventArgs
{
    ESyncEventKind Kind = ESyncEventKind::MethodInvoked; /**< @brief Method call or property assignment. */
    std::string MemberName{}; /**< @brief Registered method or property name. */
    std::vector<Variant> Args{}; /**< @brief Positional arguments (the new value for properties). */
    StateSyncOptions Options = EStateSyncOption::Default; /**< @brief Options popped from the BeginSync stack. */

    static SyncEventArgs Method(std::string Name, std::vector<Variant> Arguments = {});
    static SyncEventArgs Property(std::string Name, Variant Value);

    /**
     * @brief "Fire(3, \"left\")" for methods, "Health = 10" for properties.
     */
    std::string ToString() const;
};

/**
 * @brief Sync event read from bytes, target not yet resolved.
 */
struct EncodedSyncEvent
{
    Uuid TargetId{}; /**< @brief Unique id of the target object. */
    SyncEventArgs Args{}; /**< @brief Decoded call. */
};

/**
 * @brief Sync event read from bytes with its target resolved.
 */
struct DecodedSyncEvent
{
    IStateSync* Target = nullptr; /**< @brief Live target (non-owning). */
    SyncEventArgs Args{}; /**< @brief Decoded call. */
};

/**
 * @brief Encode a sync event.
 * @remarks Wire form: target id (16 bytes), kind (u8), member name (string),
 * argument count (varint), then every argument as a tagged Variant.
 * @return NotReady when the target has no id yet, UnknownVariant when an
 * argument type has no codec.
 */
SNAPI_STATESYNC_API TExpected<std::vector<uint8_t>> SerializeEventBinary(const IUniqueId& Target,
                                                                          const SyncEventArgs& Args,
                                                                          uint16_t Version = kCurrentBinaryVersion);

/**
 * @brief Decode a sync event without resolving its target.
 * @return DeserializationFailed for truncated or trailing data or an unknown
 * kind, UnknownVariant for arguments without a codec.
 */
SNAPI_STATESYNC_API TExpected<EncodedSyncEvent> DecodeEventBinary(std::span<const uint8_t> Bytes, uint16_t Version);

/**
 * @brief Decode a sync event and resolve its target.
 * @param DecodedArgs Receives the decoded call whenever decoding succeeds,
 * including when the target cannot be resolved; may be null.
 * @return As DecodeEventBinary, plus UnknownTarget when the id is not
 * registered or the object does not accept sync events.
 */
SNAPI_STATESYNC_API TExpected<DecodedSyncEvent> DeserializeEventBinary(std::span<const uint8_t> Bytes,
                                                                        uint16_t Version,
                                                                        const UniqueIdRegistry& Registry,
                                                                        SyncEventArgs* DecodedArgs = nullptr);

} // namespace SnAPI::StateSync

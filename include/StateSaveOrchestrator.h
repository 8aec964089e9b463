#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "Expected.h"
#include "Export.h"
#include "Settings.h"
#include "StateSaveTypes.h"
#include "Uuid.h"

namespace SnAPI::StateSync
{

class IStateSave;
class ISceneHost;
class StateSaveRegistry;
class StateSyncDispatcher;
class UniqueIdRegistry;

/**
 * @brief Size of the uncompressed stream header.
 */
inline constexpr std::size_t kStateStreamHeaderSize = 4;

/**
 * @brief Summary of a LoadStateChanges call.
 */
struct LoadReport
{
    ESerializationFormat Format = ESerializationFormat::Uncompressed; /**< @brief Header format byte. */
    EStateSaveLevel Level = EStateSaveLevel::Complete; /**< @brief Header level byte. */
    uint16_t Version = 0; /**< @brief Header binary version. */
    std::size_t RecordsLoaded = 0; /**< @brief Records applied to a participant. */
    std::size_t RecordsSkipped = 0; /**< @brief Records skipped after a failure. */
    std::size_t UncompressedSize = 0; /**< @brief Record bytes after decompression. */
    std::vector<Uuid> LoadedIds{}; /**< @brief Ids of loaded participants, in stream order. */
    std::optional<Error> Failure{}; /**< @brief Stream-level error that stopped the load. */

    bool Succeeded() const
    {
        return !Failure.has_value();
    }
};

/**
 * @brief Writes participant state into one stream and reads it back.
 * @remarks
 * Stream layout: a 4-byte header `[format u8][level u8][version u16 LE]`
 * followed by records `[length varint][id 16 bytes][state version zig-zag
 * varint][payload]`. For GzipCompressed everything after the header is one
 * gzip member. The length counts every byte after the length field, so a
 * reader can always skip a record it cannot apply.
 *
 * A failure inside one participant only costs that participant's record;
 * saving and loading continue with the rest. Only a malformed header (or a
 * body that does not inflate) stops a load.
 */
class SNAPI_STATESYNC_API StateSaveOrchestrator
{
public:
    StateSaveOrchestrator(const StateSyncSettings& InSettings,
                          const UniqueIdRegistry& InUniqueIds,
                          const StateSaveRegistry& InStateSaves,
                          StateSyncDispatcher& InDispatcher);

    StateSaveOrchestrator(const StateSaveOrchestrator&) = delete;
    StateSaveOrchestrator& operator=(const StateSaveOrchestrator&) = delete;

    /**
     * @brief Host used for root queries and anchor re-application; may be null.
     */
    void SetSceneHost(ISceneHost* Host)
    {
        m_sceneHost = Host;
    }

    ISceneHost* SceneHost() const
    {
        return m_sceneHost;
    }

    /**
     * @brief Save participants into a stream.
     * @param Roots Restrict the save to participants under these roots. When
     * absent the registry's save-required view is used.
     * @param IgnoreRoots Exclude participants under these roots.
     * @return NotReady when roots are given without a scene host,
     * SerializationFailed when compression fails. Participant failures are
     * logged and omitted, not returned.
     */
    TExpected<std::vector<uint8_t>> SaveStateChanges(const std::optional<std::vector<Uuid>>& Roots,
                                                     std::span<const Uuid> IgnoreRoots,
                                                     EStateSaveLevel Level,
                                                     ESerializationFormat Format);

    /**
     * @brief Save the registry's save-required view.
     */
    TExpected<std::vector<uint8_t>> SaveStateChanges(EStateSaveLevel Level, ESerializationFormat Format);

    /**
     * @brief Apply a stream produced by SaveStateChanges.
     * @remarks Runs inside a cancelled sync bracket so that loading does not
     * emit sync events. Spatial anchors that were loaded get their position
     * re-applied through the scene host afterwards.
     */
    LoadReport LoadStateChanges(std::span<const uint8_t> Bytes);

    /**
     * @brief Participants a save with these arguments would consider, in save order (tier, then order key).
     */
    TExpected<std::vector<IStateSave*>> SelectParticipants(const std::optional<std::vector<Uuid>>& Roots,
                                                           std::span<const Uuid> IgnoreRoots,
                                                           EStateSaveLevel Level) const;

private:
    bool WriteRecord(IStateSave& Participant, EStateSaveLevel Level, std::vector<uint8_t>& Scratch, std::vector<uint8_t>& Body) const;
    Result LoadRecord(std::span<const uint8_t> Record, uint16_t Version, EStateSaveLevel Level, LoadReport& Report,
                      std::vector<IStateSave*>& Anchors) const;
    void ReadRecords(std::span<const uint8_t> Body, uint16_t Version, EStateSaveLevel Level, LoadReport& Report,
                     std::vector<IStateSave*>& Anchors) const;

    const StateSyncSettings* m_settings = nullptr; /**< @brief Settings of the owning runtime. */
    const UniqueIdRegistry* m_uniqueIds = nullptr; /**< @brief Resolves record ids on load. */
    const StateSaveRegistry* m_stateSaves = nullptr; /**< @brief Source of the save-required view. */
    StateSyncDispatcher* m_dispatcher = nullptr; /**< @brief Brackets loads in a cancelled sync. */
    ISceneHost* m_sceneHost = nullptr; /**< @brief Optional scene graph collaborator. */
};

} // namespace SnAPI::StateSync

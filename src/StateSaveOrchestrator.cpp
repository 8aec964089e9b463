#include "StateSaveOrchestrator.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <format>
#include <string>
#include <unordered_set>
#include <utility>

#include "BinarySerializer.h"
#include "DummySerializer.h"
#include "GzipCodec.h"
#include "IStateSave.h"
#include "Log.h"
#include "SceneHost.h"
#include "StateSaveRegistry.h"
#include "StateSyncDispatcher.h"
#include "UniqueIdRegistry.h"

namespace SnAPI::StateSync
{

namespace
{
double ElapsedMilliseconds(std::chrono::steady_clock::time_point Start)
{
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - Start).count();
}

std::string CompressionInfo(std::size_t Uncompressed, std::size_t Compressed)
{
    if (Uncompressed == Compressed || Compressed == 0)
    {
        return {};
    }
    return std::format(" Compressed from {} bytes ({:.2f} compression ratio).", Uncompressed,
        static_cast<double>(Uncompressed) / static_cast<double>(Compressed));
}

/**
 * @brief Closes the load's sync bracket on every exit path.
 */
class CancelledSyncScope
{
public:
    explicit CancelledSyncScope(StateSyncDispatcher& InDispatcher)
        : m_dispatcher(InDispatcher)
    {
        m_dispatcher.BeginSync(EStateSyncOption::None);
    }

    ~CancelledSyncScope()
    {
        m_dispatcher.CancelSync();
    }

    CancelledSyncScope(const CancelledSyncScope&) = delete;
    CancelledSyncScope& operator=(const CancelledSyncScope&) = delete;

private:
    StateSyncDispatcher& m_dispatcher;
};
} // namespace

StateSaveOrchestrator::StateSaveOrchestrator(const StateSyncSettings& InSettings,
                                             const UniqueIdRegistry& InUniqueIds,
                                             const StateSaveRegistry& InStateSaves,
                                             StateSyncDispatcher& InDispatcher)
    : m_settings(&InSettings)
    , m_uniqueIds(&InUniqueIds)
    , m_stateSaves(&InStateSaves)
    , m_dispatcher(&InDispatcher)
{
}

TExpected<std::vector<IStateSave*>> StateSaveOrchestrator::SelectParticipants(const std::optional<std::vector<Uuid>>& Roots,
                                                                              std::span<const Uuid> IgnoreRoots,
                                                                              EStateSaveLevel Level) const
{
    if ((Roots || !IgnoreRoots.empty()) && !m_sceneHost)
    {
        return std::unexpected(MakeError(EErrorCode::NotReady, "Root-scoped saves need a scene host"));
    }

    std::vector<IStateSave*> Selected;
    if (!Roots)
    {
        Selected = m_stateSaves->SaveRequiredParticipants();
    }
    else
    {
        const bool IncludeDisabled = Level == EStateSaveLevel::Complete;
        std::unordered_set<const IStateSave*> Seen;
        for (const Uuid& Root : *Roots)
        {
            for (IStateSave* Participant : m_sceneHost->FindStateSavesUnder(Root, IncludeDisabled))
            {
                if (Participant && Seen.insert(Participant).second)
                {
                    Selected.push_back(Participant);
                }
            }
        }
    }

    if (!IgnoreRoots.empty())
    {
        std::erase_if(Selected, [this, IgnoreRoots](const IStateSave* Participant) {
            return std::any_of(IgnoreRoots.begin(), IgnoreRoots.end(), [this, Participant](const Uuid& Root) {
                return m_sceneHost->IsDescendantOf(*Participant, Root);
            });
        });
    }

    // Tier first, then order key; ties keep registration (or hierarchy) order.
    std::stable_sort(Selected.begin(), Selected.end(), [](const IStateSave* Left, const IStateSave* Right) {
        const auto LeftTier = static_cast<uint8_t>(Left->StateSaveTier());
        const auto RightTier = static_cast<uint8_t>(Right->StateSaveTier());
        if (LeftTier != RightTier)
        {
            return LeftTier < RightTier;
        }
        return Left->SerializationOrder() < Right->SerializationOrder();
    });
    return Selected;
}

TExpected<std::vector<uint8_t>> StateSaveOrchestrator::SaveStateChanges(EStateSaveLevel Level, ESerializationFormat Format)
{
    return SaveStateChanges(std::nullopt, {}, Level, Format);
}

TExpected<std::vector<uint8_t>> StateSaveOrchestrator::SaveStateChanges(const std::optional<std::vector<Uuid>>& Roots,
                                                                        std::span<const Uuid> IgnoreRoots,
                                                                        EStateSaveLevel Level,
                                                                        ESerializationFormat Format)
{
    const auto Start = std::chrono::steady_clock::now();
    auto Participants = SelectParticipants(Roots, IgnoreRoots, Level);
    if (!Participants)
    {
        return std::unexpected(Participants.error());
    }

    std::vector<uint8_t> Body;
    std::vector<uint8_t> Scratch;
    std::size_t Written = 0;
    for (IStateSave* Participant : *Participants)
    {
        try
        {
            if (WriteRecord(*Participant, Level, Scratch, Body))
            {
                ++Written;
            }
        }
        catch (const SerializationException& Ex)
        {
            CoreLogger()->error("Error serializing {} ({}): {}", Participant->UniqueName(), Participant->UniqueTypeName(), Ex.GetError().Describe());
        }
        catch (const std::exception& Ex)
        {
            CoreLogger()->error("Error serializing {} ({}): {}", Participant->UniqueName(), Participant->UniqueTypeName(), Ex.what());
        }
    }

    const uint16_t Version = m_settings->BinaryVersion;
    std::vector<uint8_t> Output{static_cast<uint8_t>(Format), static_cast<uint8_t>(Level), static_cast<uint8_t>(Version & 0xFF),
                                static_cast<uint8_t>(Version >> 8)};
    const std::size_t UncompressedSize = Output.size() + Body.size();

    if (Format == ESerializationFormat::GzipCompressed)
    {
        auto Compressed = GzipCodec::Compress(Body);
        if (!Compressed)
        {
            CoreLogger()->error("Compressing state stream failed: {}", Compressed.error().Describe());
            return std::unexpected(Compressed.error());
        }
        Output.insert(Output.end(), Compressed->begin(), Compressed->end());
    }
    else
    {
        Output.insert(Output.end(), Body.begin(), Body.end());
    }

    CoreLogger()->info("Serialized {}/{} participant(s) from {} to {} bytes in {:.3f}ms. Format: {}, level: {}.{}", Written,
        Participants->size(), Roots ? std::to_string(Roots->size()) + " root(s)" : std::string("registry"), Output.size(),
        ElapsedMilliseconds(Start), ToString(Format), ToString(Level), CompressionInfo(UncompressedSize, Output.size()));
    return Output;
}

bool StateSaveOrchestrator::WriteRecord(IStateSave& Participant, EStateSaveLevel Level, std::vector<uint8_t>& Scratch, std::vector<uint8_t>& Body) const
{
    Uuid Id = Participant.UniqueId();
    if (Id.is_nil())
    {
        CoreLogger()->warn("{} has no unique id and cannot be saved", Participant.UniqueName());
        return false;
    }

    int32_t StateVersion = Participant.StateSerializationVersion();
    DummySerializer DryRun;
    if (!Participant.SerializeState(DryRun, StateVersion, Level, EStateSaveOption::DontCacheChanges | EStateSaveOption::DontSerialize))
    {
        return false;
    }

    // Records go through a scratch buffer so the length is known before the payload is appended.
    Scratch.clear();
    BinarySerializer Record(Scratch, m_settings->BinaryVersion);
    Record.Serialize(Id);
    Record.SerializeCompressed(StateVersion);
    Participant.SerializeState(Record, StateVersion, Level, EStateSaveOption::None);

    BinarySerializer Stream(Body, m_settings->BinaryVersion);
    const std::size_t Before = Body.size();
    uint64_t Length = Scratch.size();
    Stream.SerializeCompressed(Length);
    Stream.WriteRaw(Scratch);
    CoreLogger()->debug("Serialized {} ({}) to {} bytes. Id is {}", Participant.UniqueName(), Participant.UniqueTypeName(),
        Body.size() - Before, ToString(Id));
    return true;
}

LoadReport StateSaveOrchestrator::LoadStateChanges(std::span<const uint8_t> Bytes)
{
    LoadReport Report;
    if (Bytes.empty())
    {
        CoreLogger()->warn("LoadStateChanges: input is empty");
        Report.Failure = MakeError(EErrorCode::InvalidArgument, "Input is empty");
        return Report;
    }

    const auto Start = std::chrono::steady_clock::now();
    CancelledSyncScope SyncScope(*m_dispatcher);

    const auto Fail = [&Report](Error Failure) {
        CoreLogger()->error("LoadStateChanges: {}", Failure.Describe());
        Report.Failure = std::move(Failure);
        return Report;
    };

    if (Bytes.size() < kStateStreamHeaderSize)
    {
        return Fail(MakeError(EErrorCode::DeserializationFailed, "Truncated header (" + std::to_string(Bytes.size()) + " bytes)"));
    }
    if (Bytes[0] > static_cast<uint8_t>(ESerializationFormat::GzipCompressed))
    {
        return Fail(MakeError(EErrorCode::UnsupportedFormat, "Unknown format " + std::to_string(Bytes[0])));
    }
    if (Bytes[1] > static_cast<uint8_t>(EStateSaveLevel::ChangesSinceBeginning))
    {
        return Fail(MakeError(EErrorCode::UnsupportedFormat, "Unknown level " + std::to_string(Bytes[1])));
    }
    Report.Format = static_cast<ESerializationFormat>(Bytes[0]);
    Report.Level = static_cast<EStateSaveLevel>(Bytes[1]);
    Report.Version = static_cast<uint16_t>(Bytes[2] | (Bytes[3] << 8));
    if (Report.Version > m_settings->BinaryVersion)
    {
        return Fail(MakeError(EErrorCode::UnsupportedVersion,
            std::format("Stream version {} is newer than supported version {}", Report.Version, m_settings->BinaryVersion)));
    }

    std::span<const uint8_t> Body = Bytes.subspan(kStateStreamHeaderSize);
    std::vector<uint8_t> Inflated;
    if (Report.Format == ESerializationFormat::GzipCompressed)
    {
        auto Decompressed = GzipCodec::Decompress(Body);
        if (!Decompressed)
        {
            return Fail(Decompressed.error());
        }
        Inflated = std::move(*Decompressed);
        Body = Inflated;
    }
    Report.UncompressedSize = Body.size();

    std::vector<IStateSave*> Anchors;
    ReadRecords(Body, Report.Version, Report.Level, Report, Anchors);

    for (IStateSave* Anchor : Anchors)
    {
        if (!m_sceneHost)
        {
            CoreLogger()->warn("No scene host to re-apply the position of {}", Anchor->UniqueName());
            break;
        }
        m_sceneHost->ReapplyAnchorPosition(*Anchor);
    }

    CoreLogger()->info("Deserialized {} participant(s) from {} bytes in {:.3f}ms ({} skipped). Format: {}, level: {}.{}", Report.RecordsLoaded,
        Bytes.size(), ElapsedMilliseconds(Start), Report.RecordsSkipped, ToString(Report.Format), ToString(Report.Level),
        CompressionInfo(Report.UncompressedSize + kStateStreamHeaderSize, Bytes.size()));
    return Report;
}

void StateSaveOrchestrator::ReadRecords(std::span<const uint8_t> Body, uint16_t Version, EStateSaveLevel Level, LoadReport& Report,
                                        std::vector<IStateSave*>& Anchors) const
{
    BinarySerializer Stream(Body, Version);
    while (!Stream.AtEnd())
    {
        uint64_t Length = 0;
        try
        {
            Stream.SerializeCompressed(Length);
        }
        catch (const SerializationException& Ex)
        {
            CoreLogger()->error("Error reading a record length; cannot continue with the remaining records: {}", Ex.GetError().Describe());
            return;
        }

        const std::size_t RecordStart = Stream.Position();
        if (Length > Stream.Remaining())
        {
            CoreLogger()->error("Record length {} exceeds the {} remaining bytes; cannot continue with the remaining records", Length,
                Stream.Remaining());
            return;
        }

        const auto Record = Body.subspan(RecordStart, static_cast<std::size_t>(Length));
        if (auto Loaded = LoadRecord(Record, Version, Level, Report, Anchors); Loaded)
        {
            ++Report.RecordsLoaded;
        }
        else
        {
            ++Report.RecordsSkipped;
            CoreLogger()->warn("Cannot deserialize a record, skipping {} bytes: {}", Length, Loaded.error().Describe());
        }
        Stream.Seek(RecordStart + static_cast<std::size_t>(Length));
    }
}

Result StateSaveOrchestrator::LoadRecord(std::span<const uint8_t> Record, uint16_t Version, EStateSaveLevel Level, LoadReport& Report,
                                         std::vector<IStateSave*>& Anchors) const
{
    try
    {
        BinarySerializer Reader(Record, Version);
        Reader.SetUniqueIdRegistry(m_uniqueIds);

        Uuid Id;
        Reader.Serialize(Id);
        auto Target = m_uniqueIds->Resolve<IStateSave>(Id);
        if (!Target)
        {
            return std::unexpected(MakeError(EErrorCode::UnknownTarget, Target.error().Message));
        }

        int32_t StateVersion = 0;
        Reader.SerializeCompressed(StateVersion);
        IStateSave& Participant = Target.Get();
        Participant.SerializeState(Reader, StateVersion, Level, EStateSaveOption::None);

        if (Participant.IsSpatialAnchor())
        {
            Anchors.push_back(&Participant);
        }
        Report.LoadedIds.push_back(Id);
        CoreLogger()->debug("Deserialized {} ({}). Id is {}", Participant.UniqueName(), Participant.UniqueTypeName(), ToString(Id));
    }
    catch (const SerializationException& Ex)
    {
        return std::unexpected(Ex.GetError());
    }
    catch (const std::exception& Ex)
    {
        return std::unexpected(MakeError(EErrorCode::DeserializationFailed, Ex.what()));
    }
    return Ok();
}

} // namespace SnAPI::StateSync

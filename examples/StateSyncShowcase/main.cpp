#include <cstdint>
#include <string>
#include <vector>

#include "StateSync.hpp"

using namespace SnAPI::StateSync;

namespace
{
class DoorComponent final : public StateComponent
{
public:
    DoorComponent(StateSyncRuntime& InRuntime, std::string InPath)
        : StateComponent(InRuntime, "SnAPI::StateSync::Showcase::DoorComponent", std::move(InPath))
    {
        SyncMethods().RegisterMethod("Open", *this, &DoorComponent::Open);
        SyncMethods().RegisterProperty("Label", *this, &DoorComponent::SetLabel);
    }

    void Open(float Angle)
    {
        BeginSync();
        m_angle = Angle;
        m_openCount += 1;
        EndSyncMethod("Open", Angle);
    }

    void SetLabel(std::string Value)
    {
        BeginSync();
        m_label = Value;
        EndSyncProperty("Label", Value);
    }

    float Angle() const
    {
        return m_angle;
    }

    int32_t OpenCount() const
    {
        return m_openCount;
    }

    const std::string& Label() const
    {
        return m_label;
    }

protected:
    bool SerializeStateInternal(ISerializer& Serializer, int32_t, EStateSaveLevel Level, StateSaveOptions Options) override
    {
        bool Any = SerializeStateValue(Serializer, Level, Options, "Angle", m_angle);
        Any |= SerializeStateValue(Serializer, Level, Options, "OpenCount", m_openCount);
        Any |= SerializeStateValue(Serializer, Level, Options, "Label", m_label);
        return Any;
    }

private:
    float m_angle = 0.0f;
    int32_t m_openCount = 0;
    std::string m_label = "Door";
};
} // namespace

int main()
{
    StateSyncSettings Settings{};
    Settings.Log.Level = spdlog::level::debug;

    StateSyncRuntime Host;
    StateSyncRuntime Peer;
    if (const auto Initialized = Host.Initialize(Settings); !Initialized)
    {
        CoreLogger()->critical("Host runtime failed to initialize: {}", Initialized.error().Describe());
        return 1;
    }
    if (const auto Initialized = Peer.Initialize(Settings); !Initialized)
    {
        CoreLogger()->critical("Peer runtime failed to initialize: {}", Initialized.error().Describe());
        return 1;
    }
    auto Log = GetLogger("Showcase");

    DoorComponent HostDoor(Host, "Level/Entrance/Door");
    DoorComponent PeerDoor(Peer, "Level/Entrance/Door");
    if (!HostDoor.Initialize() || !PeerDoor.Initialize())
    {
        Log->error("Door registration failed");
        return 1;
    }
    Host.EndFrame();
    Peer.EndFrame();

    // Every published call on the host is encoded and replayed on the peer.
    std::vector<std::vector<uint8_t>> Outbox;
    Host.Dispatcher().ComponentStateChanged.Add([&Host, &Outbox, &Log](IStateSync& Target, const SyncEventArgs& Args) {
        Log->info("Host published {}", Args.ToString());
        if (auto Bytes = Host.Dispatcher().SerializeEvent(Target, Args))
        {
            Outbox.push_back(std::move(*Bytes));
        }
        else
        {
            Log->error("Cannot encode {}: {}", Args.ToString(), Bytes.error().Describe());
        }
    });

    HostDoor.Open(90.0f);
    HostDoor.SetLabel("Main entrance");

    for (const auto& Bytes : Outbox)
    {
        const StateSyncResult Result = Peer.ExecuteStateSyncEvent(Bytes);
        if (Result.IsError())
        {
            Log->error("Replay failed: {}", Result.ErrorMessage);
            return 1;
        }
    }
    Log->info("Peer door after replay: angle {}, label '{}'", PeerDoor.Angle(), PeerDoor.Label());

    // A late joiner catches up from a compressed complete save instead.
    StateSyncRuntime LateJoiner;
    if (const auto Initialized = LateJoiner.Initialize(Settings); !Initialized)
    {
        Log->error("Late joiner failed to initialize: {}", Initialized.error().Describe());
        return 1;
    }
    DoorComponent LateDoor(LateJoiner, "Level/Entrance/Door");
    if (!LateDoor.Initialize())
    {
        Log->error("Late door registration failed");
        return 1;
    }

    const auto Snapshot = Host.SaveStateChanges(EStateSaveLevel::Complete, ESerializationFormat::GzipCompressed);
    if (!Snapshot)
    {
        Log->error("Save failed: {}", Snapshot.error().Describe());
        return 1;
    }
    const LoadReport Report = LateJoiner.LoadStateChanges(*Snapshot);
    if (!Report.Succeeded())
    {
        Log->error("Load failed: {}", Report.Failure->Describe());
        return 1;
    }

    if (LateDoor.OpenCount() != HostDoor.OpenCount() || LateDoor.Label() != HostDoor.Label()
        || PeerDoor.OpenCount() != HostDoor.OpenCount())
    {
        Log->error("Door states diverged");
        return 1;
    }

    // Nothing changed since the snapshot, so an incremental save is header-only.
    const auto Delta = Host.SaveStateChanges(EStateSaveLevel::ChangesSincePreviousSave);
    Log->info("Incremental save after snapshot: {} bytes", Delta ? Delta->size() : 0);

    Log->info("StateSyncShowcase ran successfully");
    return 0;
}

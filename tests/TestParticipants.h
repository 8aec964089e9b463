#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "StateSync.hpp"

namespace SnAPI::StateSync::Testing
{

/**
 * @brief Settings used by every test runtime: no console sinks, strict nesting.
 */
inline StateSyncSettings MakeTestSettings()
{
    StateSyncSettings Settings{};
    Settings.ConfigureLoggingOnInitialize = false;
    return Settings;
}

/**
 * @brief Runtime initialized with MakeTestSettings (or the given settings).
 */
struct TestRuntime
{
    explicit TestRuntime(const StateSyncSettings& Settings = MakeTestSettings())
    {
        const auto Initialized = Runtime.Initialize(Settings);
        if (!Initialized)
        {
            throw std::runtime_error(Initialized.error().Describe());
        }
    }

    StateSyncRuntime Runtime{};
};

/**
 * @brief Component with a handful of tracked fields and replayable members.
 * @remarks Loading a changed Health re-applies it through SetHealth, which
 * opens a nested sync bracket inside the load's cancelled bracket.
 */
class HealthComponent : public StateComponent
{
public:
    HealthComponent(StateSyncRuntime& InRuntime, std::string InPath)
        : StateComponent(InRuntime, "SnAPI::StateSync::Testing::HealthComponent", std::move(InPath))
    {
        SyncMethods().RegisterMethod("SetHealth", *this, &HealthComponent::SetHealth);
        SyncMethods().RegisterMethod("TakeDamage", *this, &HealthComponent::TakeDamage);
        SyncMethods().RegisterMethod("Rename", *this, &HealthComponent::Rename);
        SyncMethods().RegisterMethod("Explode", *this, &HealthComponent::Explode);
        SyncMethods().RegisterMethod("ExplodeOddly", *this, &HealthComponent::ExplodeOddly);
        SyncMethods().RegisterProperty("Speed", *this, &HealthComponent::SetSpeed);
    }

    void SetHealth(int32_t Value)
    {
        BeginSync();
        m_health = Value;
        ++HealthApplied;
        EndSyncMethod("SetHealth", Value);
    }

    void TakeDamage(int32_t Amount)
    {
        BeginSync();
        SetHealth(m_health - Amount);
        EndSyncMethod("TakeDamage", Amount);
    }

    void Rename(const std::string& Value)
    {
        auto Sync = MakeScopedSync();
        m_name = Value;
        Sync.EndMethod("Rename", Value);
    }

    void Explode()
    {
        throw std::runtime_error("boom");
    }

    void ExplodeOddly()
    {
        throw 42;
    }

    void SetSpeed(float Value)
    {
        BeginSync();
        m_speed = Value;
        EndSyncProperty("Speed", Value);
    }

    int32_t Health() const
    {
        return m_health;
    }

    float Speed() const
    {
        return m_speed;
    }

    const std::string& Name() const
    {
        return m_name;
    }

    const Vec3& Position() const
    {
        return m_position;
    }

    void SetPositionUnsynced(const Vec3& Value)
    {
        m_position = Value;
    }

    void SetHealthUnsynced(int32_t Value)
    {
        m_health = Value;
    }

    int32_t StateSerializationVersion() const override
    {
        return StateVersion;
    }

    int32_t SerializationOrder() const override
    {
        return Order;
    }

    bool SaveStateWhenDisabled() const override
    {
        return SaveWhenDisabled;
    }

    bool SerializeEnabledState() const override
    {
        return SaveEnabled;
    }

    EStateSaveTier StateSaveTier() const override
    {
        return Tier;
    }

    bool IsSpatialAnchor() const override
    {
        return SpatialAnchor;
    }

    int32_t StateVersion = 1;
    int32_t Order = 0;
    bool SaveWhenDisabled = false;
    bool SaveEnabled = false;
    bool SpatialAnchor = false;
    EStateSaveTier Tier = EStateSaveTier::Component;
    int HealthApplied = 0;
    int32_t LastLoadedVersion = -1;

protected:
    bool SerializeStateInternal(ISerializer& Serializer, int32_t DeclaredVersion, EStateSaveLevel Level, StateSaveOptions Options) override
    {
        if (Serializer.IsReading() && !Serializer.IsNoOp())
        {
            LastLoadedVersion = DeclaredVersion;
        }

        bool Any = false;
        if (SerializeStateValue(Serializer, Level, Options, "Health", m_health))
        {
            Any = true;
            if (Serializer.IsReading() && !Serializer.IsNoOp())
            {
                SetHealth(m_health);
            }
        }
        Any |= SerializeStateValue(Serializer, Level, Options, "Speed", m_speed);
        Any |= SerializeStateValue(Serializer, Level, Options, "Name", m_name);
        Any |= SerializeStateValue(Serializer, Level, Options, "Position", m_position);
        return Any;
    }

private:
    int32_t m_health = 100;
    float m_speed = 1.0f;
    std::string m_name = "unnamed";
    Vec3 m_position{};
};

/**
 * @brief Component without tracked fields; registration excludes it.
 */
class EmptyComponent : public StateComponent
{
public:
    EmptyComponent(StateSyncRuntime& InRuntime, std::string InPath)
        : StateComponent(InRuntime, "SnAPI::StateSync::Testing::EmptyComponent", std::move(InPath))
    {
    }

    bool HasField = false;
    int32_t Field = 0;

protected:
    bool SerializeStateInternal(ISerializer& Serializer, int32_t, EStateSaveLevel Level, StateSaveOptions Options) override
    {
        return HasField && SerializeStateValue(Serializer, Level, Options, "Field", Field);
    }
};

/**
 * @brief Component that fails while actually writing or reading bytes.
 */
class FaultyComponent : public StateComponent
{
public:
    FaultyComponent(StateSyncRuntime& InRuntime, std::string InPath)
        : StateComponent(InRuntime, "SnAPI::StateSync::Testing::FaultyComponent", std::move(InPath))
    {
    }

    bool FailOnWrite = true;
    bool FailOnRead = false;
    int32_t Value = 7;

protected:
    bool SerializeStateInternal(ISerializer& Serializer, int32_t, EStateSaveLevel Level, StateSaveOptions Options) override
    {
        if (!Serializer.IsNoOp() && ((Serializer.IsWriting() && FailOnWrite) || (Serializer.IsReading() && FailOnRead)))
        {
            throw std::runtime_error("faulty component");
        }
        return SerializeStateValue(Serializer, Level, Options, "Value", Value);
    }
};

/**
 * @brief In-memory scene graph: each root owns a list of participants.
 */
class FakeSceneHost final : public ISceneHost
{
public:
    void AddUnder(const Uuid& Root, IStateSave& Participant)
    {
        m_children[Root].push_back(&Participant);
    }

    std::vector<IStateSave*> FindStateSavesUnder(const Uuid& RootId, bool IncludeDisabled) const override
    {
        std::vector<IStateSave*> Found;
        const auto It = m_children.find(RootId);
        if (It == m_children.end())
        {
            return Found;
        }
        for (IStateSave* Participant : It->second)
        {
            if (IncludeDisabled || Participant->IsStateSaveEnabled())
            {
                Found.push_back(Participant);
            }
        }
        return Found;
    }

    bool IsDescendantOf(const IStateSave& Participant, const Uuid& RootId) const override
    {
        const auto It = m_children.find(RootId);
        if (It == m_children.end())
        {
            return false;
        }
        for (const IStateSave* Child : It->second)
        {
            if (Child == &Participant)
            {
                return true;
            }
        }
        return false;
    }

    void ReapplyAnchorPosition(IStateSave& Participant) override
    {
        Reapplied.push_back(&Participant);
    }

    std::vector<IStateSave*> Reapplied{};

private:
    std::unordered_map<Uuid, std::vector<IStateSave*>, UuidHash> m_children{};
};

} // namespace SnAPI::StateSync::Testing

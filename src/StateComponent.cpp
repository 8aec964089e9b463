#include "StateComponent.h"

#include "Log.h"
#include "StateSyncRuntime.h"

namespace SnAPI::StateSync
{

StateComponent::StateComponent(StateSyncRuntime& InRuntime, std::string InTypeName, std::string InPath)
    : m_runtime(&InRuntime)
    , m_typeName(std::move(InTypeName))
    , m_path(std::move(InPath))
    , m_state(*this)
{
    m_state.SetEvents(&m_runtime->StateSaves().Events);
}

StateComponent::~StateComponent()
{
    Shutdown();
}

Result StateComponent::Initialize(const Uuid& PreferredId)
{
    if (m_initialized)
    {
        return Ok();
    }

    auto Id = m_runtime->UniqueIds().Register(*this, PreferredId);
    if (!Id)
    {
        return std::unexpected(Id.error());
    }

    auto Admitted = m_runtime->StateSaves().Register(*this);
    if (!Admitted)
    {
        if (auto Removed = m_runtime->UniqueIds().Unregister(*this); !Removed)
        {
            CoreLogger()->warn("Rolling back registration of {} failed: {}", UniqueName(), Removed.error().Describe());
        }
        return std::unexpected(Admitted.error());
    }
    if (!*Admitted)
    {
        CoreLogger()->debug("{} ({}) produces no state and is not saved", UniqueName(), UniqueTypeName());
    }

    m_initialized = true;
    return Ok();
}

void StateComponent::Shutdown()
{
    if (!m_initialized)
    {
        return;
    }
    m_initialized = false;
    m_runtime->StateSaves().Unregister(*this);
    if (auto Removed = m_runtime->UniqueIds().Unregister(*this); !Removed)
    {
        CoreLogger()->warn("Unregistering {} failed: {}", UniqueName(), Removed.error().Describe());
    }
}

void StateComponent::SetEnabled(bool Enabled)
{
    if (m_enabled == Enabled)
    {
        return;
    }
    m_enabled = Enabled;
    if (!m_initialized)
    {
        return;
    }
    if (Enabled)
    {
        m_runtime->StateSaves().NotifyEnabled(*this);
    }
    else
    {
        m_runtime->StateSaves().NotifyDisabled(*this);
    }
}

bool StateComponent::SerializeState(ISerializer& Serializer, int32_t DeclaredVersion, EStateSaveLevel Level, StateSaveOptions Options)
{
    m_state.SetPrecisionThreshold(m_runtime->Settings().FloatPrecisionThreshold);
    m_state.BeginState(Serializer, Level, Options);

    bool Transferred = false;
    if (SerializeEnabledState())
    {
        bool Enabled = m_enabled;
        Transferred = m_state.SerializeStateValue(Serializer, Level, Options, "IsEnabled", Enabled);
        if (Transferred && Serializer.IsReading() && !Serializer.IsNoOp() && Enabled != m_enabled)
        {
            SetEnabled(Enabled);
        }
    }

    Transferred |= SerializeStateInternal(Serializer, DeclaredVersion, Level, Options);
    return m_state.EndState(Serializer, Level, Options) || Transferred;
}

void StateComponent::BeginSync(StateSyncOptions Options)
{
    Dispatcher().BeginSync(Options);
}

void StateComponent::CancelSync()
{
    Dispatcher().CancelSync();
}

bool StateComponent::IsInsideStateSync() const
{
    return Dispatcher().IsInsideStateSync();
}

StateSyncDispatcher& StateComponent::Dispatcher() const
{
    return m_runtime->Dispatcher();
}

} // namespace SnAPI::StateSync

#include "StateSaveImplementer.h"

namespace SnAPI::StateSync
{

StateSaveImplementer::StateSaveImplementer(IStateSave& InOwner)
    : m_owner(&InOwner)
{
}

void StateSaveImplementer::BeginState(ISerializer& Serializer, EStateSaveLevel Level, StateSaveOptions Options)
{
    m_counterAtBegin = m_serializeCounter;
    if (!m_events || m_events->StateSerializing.Empty())
    {
        return;
    }
    StateSaveEventArgs Args;
    Args.Participant = m_owner;
    Args.IsReading = Serializer.IsReading();
    Args.Level = Level;
    Args.Options = Options;
    m_events->StateSerializing.Broadcast(Args);
}

bool StateSaveImplementer::EndState(ISerializer& Serializer, EStateSaveLevel Level, StateSaveOptions Options)
{
    if (m_events && !m_events->StateSerialized.Empty())
    {
        StateSaveEventArgs Args;
        Args.Participant = m_owner;
        Args.IsReading = Serializer.IsReading();
        Args.Level = Level;
        Args.Options = Options;
        m_events->StateSerialized.Broadcast(Args);
    }
    return m_serializeCounter != m_counterAtBegin;
}

bool StateSaveImplementer::HasBaseline(std::string_view Name) const
{
    return m_initialValues.contains(std::string(Name));
}

void StateSaveImplementer::ClearBaselines()
{
    m_initialValues.clear();
    m_lastValues.clear();
}

bool StateSaveImplementer::HasVarListeners() const
{
    return m_events && (!m_events->VarSerializing.Empty() || !m_events->VarSerialized.Empty());
}

void StateSaveImplementer::RaiseVarEvent(bool Before,
                                         const ISerializer& Serializer,
                                         EStateSaveLevel Level,
                                         StateSaveOptions Options,
                                         std::string_view Name,
                                         const Variant& OldValue,
                                         const Variant& NewValue) const
{
    StateSaveEventArgs Args;
    Args.Participant = m_owner;
    Args.IsReading = Serializer.IsReading();
    Args.Level = Level;
    Args.Options = Options;
    Args.VarName = std::string(Name);
    Args.OldValue = OldValue;
    Args.NewValue = NewValue;
    (Before ? m_events->VarSerializing : m_events->VarSerialized).Broadcast(Args);
}

} // namespace SnAPI::StateSync

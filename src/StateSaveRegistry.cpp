#include "StateSaveRegistry.h"

#include <algorithm>
#include <exception>
#include <utility>

#include "DummySerializer.h"
#include "Log.h"

namespace SnAPI::StateSync
{

namespace
{
bool Contains(const std::vector<IStateSave*>& List, const IStateSave* Participant)
{
    return std::find(List.begin(), List.end(), Participant) != List.end();
}

void AddUnique(std::vector<IStateSave*>& List, IStateSave* Participant)
{
    if (!Contains(List, Participant))
    {
        List.push_back(Participant);
    }
}

/**
 * @brief Insert Participant into List at its position in Order (registration order).
 */
void InsertInOrder(std::vector<IStateSave*>& List, IStateSave* Participant, const std::vector<IStateSave*>& Order)
{
    if (Contains(List, Participant))
    {
        return;
    }
    const auto Rank = [&Order](const IStateSave* Item) {
        return std::find(Order.begin(), Order.end(), Item) - Order.begin();
    };
    const auto ParticipantRank = Rank(Participant);
    const auto Position = std::find_if(List.begin(), List.end(), [&Rank, ParticipantRank](const IStateSave* Item) {
        return Rank(Item) > ParticipantRank;
    });
    List.insert(Position, Participant);
}

void RemoveItem(std::vector<IStateSave*>& List, const IStateSave* Participant)
{
    List.erase(std::remove(List.begin(), List.end(), Participant), List.end());
}
} // namespace

TExpected<bool> StateSaveRegistry::Register(IStateSave& Participant)
{
    if (IsRegistered(Participant))
    {
        return true;
    }
    if (IsExcluded(Participant))
    {
        return false;
    }
    return Admit(Participant);
}

TExpected<bool> StateSaveRegistry::Admit(IStateSave& Participant)
{
    if (Participant.StateSaveTier() == EStateSaveTier::GlobalState)
    {
        if (m_globalState && m_globalState != &Participant)
        {
            return std::unexpected(MakeError(EErrorCode::AlreadyExists,
                "Global state participant already registered: " + m_globalState->UniqueName()));
        }
        m_globalState = &Participant;
        AddUnique(m_pendingBaselines, &Participant);
        CoreLogger()->debug("Registered global state participant {}", Participant.UniqueName());
        return true;
    }

    if (!ProducesState(Participant))
    {
        m_excluded.insert(&Participant);
        CoreLogger()->debug("{} produces no state data and is excluded from state saves", Participant.UniqueName());
        return false;
    }

    TierViews* Views = ViewsFor(Participant);
    AddUnique(Views->All, &Participant);
    if (Participant.SaveStateWhenDisabled())
    {
        InsertInOrder(Views->SaveRequired, &Participant, Views->All);
    }
    AddUnique(m_pendingBaselines, &Participant);
    if (Participant.IsStateSaveEnabled())
    {
        NotifyEnabled(Participant);
    }
    CoreLogger()->debug("Registered state save participant {}", Participant.UniqueName());
    return true;
}

bool StateSaveRegistry::ProducesState(IStateSave& Participant) const
{
    DummySerializer Serializer;
    try
    {
        return Participant.SerializeState(Serializer, Participant.StateSerializationVersion(), EStateSaveLevel::Complete,
            EStateSaveOption::DontSerialize | EStateSaveOption::DontCacheChanges);
    }
    catch (const std::exception& Ex)
    {
        CoreLogger()->error("State save dry run of {} failed: {}", Participant.UniqueName(), Ex.what());
        return false;
    }
}

void StateSaveRegistry::Unregister(IStateSave& Participant)
{
    RemoveItem(m_pendingBaselines, &Participant);
    m_excluded.erase(&Participant);
    if (m_globalState == &Participant)
    {
        m_globalState = nullptr;
        return;
    }
    for (TierViews* Views : {&m_singletons, &m_components})
    {
        RemoveItem(Views->All, &Participant);
        RemoveItem(Views->Enabled, &Participant);
        RemoveItem(Views->SaveRequired, &Participant);
    }
}

void StateSaveRegistry::NotifyEnabled(IStateSave& Participant)
{
    if (m_globalState == &Participant)
    {
        return;
    }
    TierViews* Views = ViewsFor(Participant);
    if (!Contains(Views->All, &Participant))
    {
        return;
    }
    InsertInOrder(Views->Enabled, &Participant, Views->All);
    InsertInOrder(Views->SaveRequired, &Participant, Views->All);
}

void StateSaveRegistry::NotifyDisabled(IStateSave& Participant)
{
    if (m_globalState == &Participant)
    {
        return;
    }
    TierViews* Views = ViewsFor(Participant);
    RemoveItem(Views->Enabled, &Participant);
    if (!Participant.SaveStateWhenDisabled())
    {
        RemoveItem(Views->SaveRequired, &Participant);
    }
}

TExpected<bool> StateSaveRegistry::Reconsider(IStateSave& Participant)
{
    if (IsRegistered(Participant))
    {
        return true;
    }
    m_excluded.erase(&Participant);
    return Admit(Participant);
}

bool StateSaveRegistry::IsRegistered(const IStateSave& Participant) const
{
    if (m_globalState == &Participant)
    {
        return true;
    }
    return Contains(ViewsFor(Participant)->All, &Participant);
}

bool StateSaveRegistry::IsExcluded(const IStateSave& Participant) const
{
    return m_excluded.contains(&Participant);
}

bool StateSaveRegistry::IsEnabled(const IStateSave& Participant) const
{
    if (m_globalState == &Participant)
    {
        return Participant.IsStateSaveEnabled();
    }
    return Contains(ViewsFor(Participant)->Enabled, &Participant);
}

std::vector<IStateSave*> StateSaveRegistry::AllParticipants() const
{
    return Collect(&TierViews::All, m_globalState != nullptr);
}

std::vector<IStateSave*> StateSaveRegistry::EnabledParticipants() const
{
    return Collect(&TierViews::Enabled, m_globalState && m_globalState->IsStateSaveEnabled());
}

std::vector<IStateSave*> StateSaveRegistry::SaveRequiredParticipants() const
{
    return Collect(&TierViews::SaveRequired, m_globalState != nullptr);
}

void StateSaveRegistry::NotifyEndOfFrame()
{
    if (m_pendingBaselines.empty())
    {
        return;
    }
    const std::vector<IStateSave*> Pending = std::exchange(m_pendingBaselines, {});
    for (IStateSave* Participant : Pending)
    {
        try
        {
            Participant->StoreInitialState();
        }
        catch (const std::exception& Ex)
        {
            CoreLogger()->error("Capturing the initial state of {} failed: {}", Participant->UniqueName(), Ex.what());
        }
    }
    CoreLogger()->trace("Captured initial state of {} participants", Pending.size());
}

StateSaveRegistry::TierViews* StateSaveRegistry::ViewsFor(const IStateSave& Participant)
{
    return Participant.StateSaveTier() == EStateSaveTier::Singleton ? &m_singletons : &m_components;
}

const StateSaveRegistry::TierViews* StateSaveRegistry::ViewsFor(const IStateSave& Participant) const
{
    return Participant.StateSaveTier() == EStateSaveTier::Singleton ? &m_singletons : &m_components;
}

std::vector<IStateSave*> StateSaveRegistry::Collect(std::vector<IStateSave*> TierViews::*View, bool IncludeGlobal) const
{
    const auto& Singletons = m_singletons.*View;
    const auto& Components = m_components.*View;
    std::vector<IStateSave*> Result;
    Result.reserve(Singletons.size() + Components.size() + 1);
    if (IncludeGlobal)
    {
        Result.push_back(m_globalState);
    }
    Result.insert(Result.end(), Singletons.begin(), Singletons.end());
    Result.insert(Result.end(), Components.begin(), Components.end());
    return Result;
}

} // namespace SnAPI::StateSync

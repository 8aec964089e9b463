#include "StateSyncDispatcher.h"

#include <exception>
#include <utility>

#include "Assert.h"
#include "Log.h"
#include "UniqueIdRegistry.h"

namespace SnAPI::StateSync
{

std::string StateSyncResult::ToString() const
{
    const std::string ErrorText = IsError() ? " Error is: " + ErrorMessage : std::string();
    if (Target && EventArgs)
    {
        const char* Outcome = IsError() ? "Could not execute state change" : "Successful state change";
        return std::string(Outcome) + " event for " + Target->UniqueName() + ", " + EventArgs->ToString() + "." + ErrorText;
    }
    if (EventArgs)
    {
        return "Event for unresolved target: " + EventArgs->ToString() + "." + ErrorText;
    }
    return "Undecodable event." + ErrorText;
}

StateSyncDispatcher::StateSyncDispatcher(const StateSyncSettings& InSettings, const UniqueIdRegistry& InUniqueIds)
    : m_settings(&InSettings)
    , m_uniqueIds(&InUniqueIds)
{
}

void StateSyncDispatcher::BeginSync(StateSyncOptions Options)
{
    ++m_depth;
    m_optionStack.push_back(Options);
    if (m_depth > m_settings->SyncCallDepthErrorThreshold)
    {
        CoreLogger()->error("Sync call depth is {}; a BeginSync is probably missing its EndSync or CancelSync", m_depth);
    }
}

void StateSyncDispatcher::CancelSync()
{
    if (m_depth <= 0)
    {
        CoreLogger()->error("CancelSync without a matching BeginSync");
        return;
    }
    --m_depth;
    m_optionStack.pop_back();
}

void StateSyncDispatcher::EndSyncState(IStateSync& Target, SyncEventArgs Args)
{
    if (m_depth <= 0)
    {
        CoreLogger()->error("EndSync for {} ({}) without a matching BeginSync", Target.UniqueName(), Args.ToString());
        return;
    }

    DEBUG_ASSERT(m_optionStack.size() == static_cast<std::size_t>(m_depth), "Option stack holds {} entries at depth {}", m_optionStack.size(), m_depth);
    Args.Options = m_optionStack.back();
    m_optionStack.pop_back();

    struct DepthRelease
    {
        int& Depth;
        ~DepthRelease()
        {
            --Depth;
        }
    } Release{m_depth};

    if (ShouldNotify(Args.Options))
    {
        ComponentStateChanged.Broadcast(Target, Args);
    }
}

bool StateSyncDispatcher::ShouldNotify(StateSyncOptions Options) const
{
    if (m_insideStateSync)
    {
        return false;
    }
    return m_depth == 1 || !m_settings->UseTopLevelStateChangesOnly || Options.Has(EStateSyncOption::IgnoreNestingCheck);
}

StateSyncResult StateSyncDispatcher::ExecuteStateSyncEvent(std::span<const uint8_t> Bytes)
{
    StateSyncResult Result;
    const auto Fail = [&Result](const Error& Failure) {
        Result.ErrorCode = Failure.Code;
        Result.ErrorMessage = Failure.Describe();
        CoreLogger()->error("Sync event replay failed: {}", Result.ToString());
        return Result;
    };

    SyncEventArgs Decoded;
    auto Event = DeserializeEventBinary(Bytes, m_settings->BinaryVersion, *m_uniqueIds, &Decoded);
    if (!Event)
    {
        if (Event.error().Code == EErrorCode::UnknownTarget)
        {
            Result.EventArgs = std::move(Decoded);
        }
        return Fail(Event.error());
    }
    Result.Target = Event->Target;
    Result.EventArgs = std::move(Event->Args);

    Error Failure;
    {
        struct InsideRestore
        {
            bool& Inside;
            bool Previous;
            ~InsideRestore()
            {
                Inside = Previous;
            }
        } Restore{m_insideStateSync, std::exchange(m_insideStateSync, true)};

        try
        {
            if (auto Applied = Result.Target->ApplySyncEvent(*Result.EventArgs); !Applied)
            {
                Failure = Applied.error();
            }
        }
        catch (const std::exception& Ex)
        {
            Failure = MakeError(EErrorCode::InvokeFailed, Ex.what());
        }
        catch (...)
        {
            Failure = MakeError(EErrorCode::InvokeFailed, "Non-standard exception thrown by " + Result.EventArgs->MemberName);
        }
    }

    if (Failure)
    {
        return Fail(Failure);
    }
    CoreLogger()->debug("Processed {} bytes of sync event data: {}", Bytes.size(), Result.ToString());
    return Result;
}

TExpected<std::vector<uint8_t>> StateSyncDispatcher::SerializeEvent(const IStateSync& Target, const SyncEventArgs& Args) const
{
    return SerializeEventBinary(Target, Args, m_settings->BinaryVersion);
}

StateSyncDispatcher::ScopedSync::ScopedSync(StateSyncDispatcher& InDispatcher, IStateSync& InTarget, StateSyncOptions Options)
    : m_dispatcher(&InDispatcher)
    , m_target(&InTarget)
    , m_open(true)
{
    m_dispatcher->BeginSync(Options);
}

StateSyncDispatcher::ScopedSync::~ScopedSync()
{
    Cancel();
}

void StateSyncDispatcher::ScopedSync::Cancel()
{
    if (Release())
    {
        m_dispatcher->CancelSync();
    }
}

bool StateSyncDispatcher::ScopedSync::Release()
{
    return std::exchange(m_open, false);
}

} // namespace SnAPI::StateSync

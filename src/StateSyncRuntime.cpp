#include "StateSyncRuntime.h"

#include <string>

#include "Log.h"

namespace SnAPI::StateSync
{

StateSyncRuntime::StateSyncRuntime()
    : m_dispatcher(m_settings, m_uniqueIds)
    , m_orchestrator(m_settings, m_uniqueIds, m_stateSaves, m_dispatcher)
{
}

StateSyncRuntime::~StateSyncRuntime() = default;

Result StateSyncRuntime::Initialize(const StateSyncSettings& InSettings)
{
    if (InSettings.BinaryVersion == 0 || InSettings.BinaryVersion > kCurrentBinaryVersion)
    {
        return std::unexpected(MakeError(EErrorCode::InvalidArgument,
            "Binary version " + std::to_string(InSettings.BinaryVersion) + " is not in [1, " + std::to_string(kCurrentBinaryVersion) + "]"));
    }
    if (InSettings.SyncCallDepthErrorThreshold <= 0)
    {
        return std::unexpected(MakeError(EErrorCode::InvalidArgument, "SyncCallDepthErrorThreshold must be positive"));
    }

    m_settings = InSettings;
    if (m_settings.ConfigureLoggingOnInitialize)
    {
        ConfigureLogging(m_settings.Log);
    }
    m_initialized = true;
    CoreLogger()->debug("State sync runtime initialized (binary version {}, top-level changes only: {})", m_settings.BinaryVersion,
        m_settings.UseTopLevelStateChangesOnly);
    return Ok();
}

void StateSyncRuntime::EndFrame()
{
    m_stateSaves.NotifyEndOfFrame();
}

} // namespace SnAPI::StateSync

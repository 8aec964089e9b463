#include "Log.h"

#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace SnAPI::StateSync
{

namespace
{
struct LoggerRegistry
{
    std::mutex Mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> Loggers;
    LogSettings Settings;
};

LoggerRegistry& Registry()
{
    static LoggerRegistry Instance;
    return Instance;
}

std::vector<spdlog::sink_ptr> CreateSinks(const LogSettings& Settings, const std::string& Name)
{
    std::vector<spdlog::sink_ptr> Sinks;

    if (Settings.ConsoleEnabled)
    {
        auto ConsoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        ConsoleSink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        Sinks.push_back(std::move(ConsoleSink));
    }

    if (Settings.FileEnabled && !Settings.LogDirectory.empty())
    {
        try
        {
            const auto Path = std::filesystem::path(Settings.LogDirectory) / (Name + ".log");
            auto FileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(Path.string(), Settings.MaxFileSize, Settings.MaxFiles);
            FileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            Sinks.push_back(std::move(FileSink));
        }
        catch (const spdlog::spdlog_ex& Ex)
        {
            // Console output still works; report why the file sink is missing.
            spdlog::warn("Could not open log file for '{}': {}", Name, Ex.what());
        }
    }

    return Sinks;
}
} // namespace

void ConfigureLogging(const LogSettings& Settings)
{
    auto& Reg = Registry();
    std::lock_guard<std::mutex> Lock(Reg.Mutex);
    Reg.Settings = Settings;

    for (auto& [Name, Logger] : Reg.Loggers)
    {
        auto Sinks = CreateSinks(Reg.Settings, Name);
        Logger->sinks() = std::move(Sinks);
        Logger->set_level(Reg.Settings.Level);
    }
}

std::shared_ptr<spdlog::logger> GetLogger(const std::string& Name)
{
    auto& Reg = Registry();
    std::lock_guard<std::mutex> Lock(Reg.Mutex);

    if (auto It = Reg.Loggers.find(Name); It != Reg.Loggers.end())
    {
        return It->second;
    }

    auto Sinks = CreateSinks(Reg.Settings, Name);
    auto Logger = std::make_shared<spdlog::logger>(Name, Sinks.begin(), Sinks.end());
    Logger->set_level(Reg.Settings.Level);
    Reg.Loggers.emplace(Name, Logger);

    if (!spdlog::get(Name))
    {
        spdlog::register_logger(Logger);
    }
    return Logger;
}

std::shared_ptr<spdlog::logger> CoreLogger()
{
    static std::shared_ptr<spdlog::logger> Logger = GetLogger("StateSync");
    return Logger;
}

spdlog::level::level_enum ParseLogLevel(std::string_view Name)
{
    if (Name == "trace") return spdlog::level::trace;
    if (Name == "debug") return spdlog::level::debug;
    if (Name == "info") return spdlog::level::info;
    if (Name == "warn" || Name == "warning") return spdlog::level::warn;
    if (Name == "error" || Name == "err") return spdlog::level::err;
    if (Name == "critical") return spdlog::level::critical;
    if (Name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace SnAPI::StateSync

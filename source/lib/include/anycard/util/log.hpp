#pragma once

#include <ctime>
#include <functional>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

#include <fmt/format.h>

#include <anycard/util/log_flags.hpp>

/*
        A Log can be called from any thread and will write to the console and/or a log file
        Both are optional and choosen by the client at construction
        Logging without a registered sink of the requested name is a no-op
*/
class Log
{
  public:
    Log(LogFlags log_flags, std::string_view log_name);
    ~Log();

    Log(const Log&) = delete;
    Log& operator=(const Log&) = delete;

    static Log* GetInstance(std::string_view log_name);

    static bool RegisterThreadName(std::string_view thread_name);
    static std::string_view GetThreadName(const std::thread::id& thread_id);

    /*
            Severity of a message, intended for developers not for users
    */
    enum class LogLevel
    {
        Information,
        Debug,
        Warning,
        Error,
        Fatal
    };

    struct DetailInformation
    {
        std::time_t m_Time;
        std::string_view m_File;
        std::size_t m_Line;
        std::size_t m_Column;
        std::string_view m_Function;
        std::string_view m_Thread;
    };

    /*
            Hooks receive every message after it was flushed
    */
    using LogHook = std::function<void(const Log::DetailInformation&, Log::LogLevel, std::string_view)>;
    uint32_t InstallHook(LogHook hook);
    void UninstallHook(uint32_t hook_id);

    /*
            Captures the call site together with a compile-time checked format string
    */
    template<class... Args>
    struct LogMessageWrapper
    {
        consteval LogMessageWrapper(const char* message, std::source_location source_info = std::source_location::current())
            : m_Message{ message }
            , m_SourceInfo{ source_info }
        {
        }

        fmt::format_string<Args...> m_Message;
        std::source_location m_SourceInfo;
    };
    template<class... Args>
    using LogMessage = LogMessageWrapper<std::type_identity_t<Args>...>;

    void PrintRaw(const DetailInformation& detail_info, LogLevel level, std::string_view message);

    template<class... Args>
    static void DoLog(std::string_view log_name, LogLevel level, const LogMessage<Args...>& message, Args&&... args)
    {
        if (Log* log_sink{ Log::GetInstance(log_name) })
        {
            const DetailInformation detail_info{
                std::time(nullptr),
                message.m_SourceInfo.file_name(),
                message.m_SourceInfo.line(),
                message.m_SourceInfo.column(),
                message.m_SourceInfo.function_name(),
                GetThreadName(std::this_thread::get_id()),
            };
            const auto formatted{ fmt::format(message.m_Message, std::forward<Args>(args)...) };
            log_sink->PrintRaw(detail_info, level, formatted);
        }
    }

    static constexpr std::string_view c_MainLogName{ "Main-Log" };

  private:
    class LogImpl;
    std::unique_ptr<LogImpl> m_Impl;
};

template<class... Args>
void LogInfo(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::c_MainLogName, Log::LogLevel::Information, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogDebug(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::c_MainLogName, Log::LogLevel::Debug, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogWarning(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::c_MainLogName, Log::LogLevel::Warning, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogError(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::c_MainLogName, Log::LogLevel::Error, message, std::forward<Args>(args)...);
}
template<class... Args>
void LogFatal(const Log::LogMessage<Args...>& message, Args&&... args)
{
    Log::DoLog(Log::c_MainLogName, Log::LogLevel::Fatal, message, std::forward<Args>(args)...);
}

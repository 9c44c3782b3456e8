#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <anycard/util/log.hpp>

TEST_CASE("Logging without a sink does nothing", "[log_no_sink]")
{
    REQUIRE(Log::GetInstance(Log::c_MainLogName) == nullptr);
    REQUIRE_NOTHROW(LogInfo("Nobody is listening to {}", 42));
}

TEST_CASE("Hooks receive formatted messages", "[log_hooks]")
{
    Log log{ LogFlags::DetailLine, Log::c_MainLogName };
    REQUIRE(Log::GetInstance(Log::c_MainLogName) == &log);

    std::vector<std::pair<Log::LogLevel, std::string>> messages;
    const auto hook_id{
        log.InstallHook(
            [&](const Log::DetailInformation&, Log::LogLevel level, std::string_view message)
            {
                messages.push_back({ level, std::string{ message } });
            }),
    };

    LogWarning("Unknown page format {}, falling back to {}", "Postcard", "A5");
    LogDebug("Truncated {} lines", 3);

    REQUIRE(messages.size() == 2);
    REQUIRE(messages[0].first == Log::LogLevel::Warning);
    REQUIRE(messages[0].second == "Unknown page format Postcard, falling back to A5");
    REQUIRE(messages[1].first == Log::LogLevel::Debug);
    REQUIRE(messages[1].second == "Truncated 3 lines");

    log.UninstallHook(hook_id);
    LogError("Not captured");
    REQUIRE(messages.size() == 2);
}

TEST_CASE("Log names are unique", "[log_unique_names]")
{
    Log log{ LogFlags::DetailLine, "Unique-Log" };
    REQUIRE_THROWS_AS((Log{ LogFlags::DetailLine, "Unique-Log" }), std::logic_error);
    REQUIRE(Log::GetInstance("Unique-Log") == &log);
}

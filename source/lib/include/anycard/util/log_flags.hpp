#pragma once

#include <cstdint>
#include <type_traits>

// Where a Log writes to and which call site details prefix each message
enum class LogFlags : uint32_t
{
    None = 0u,

    Console = 1u << 0u,
    File = 1u << 1u,
    FatalQuit = 1u << 2u,

    DetailTime = 1u << 3u,
    DetailFile = 1u << 4u,
    DetailLine = 1u << 5u,
    DetailColumn = DetailLine | 1u << 6u,
    DetailFunction = 1u << 7u,
    DetailThread = 1u << 8u,

    DetailAll = DetailTime | DetailFile | DetailLine | DetailColumn | DetailFunction | DetailThread,
};

constexpr LogFlags operator|(LogFlags lhs, LogFlags rhs)
{
    using BaseTy = std::underlying_type_t<LogFlags>;
    return static_cast<LogFlags>(static_cast<BaseTy>(lhs) | static_cast<BaseTy>(rhs));
}

constexpr LogFlags operator&(LogFlags lhs, LogFlags rhs)
{
    using BaseTy = std::underlying_type_t<LogFlags>;
    return static_cast<LogFlags>(static_cast<BaseTy>(lhs) & static_cast<BaseTy>(rhs));
}

// True if all bits of flags are set in log_flags
constexpr bool IsSet(LogFlags log_flags, LogFlags flags)
{
    return (log_flags & flags) == flags;
}

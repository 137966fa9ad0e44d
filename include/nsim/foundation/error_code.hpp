#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the narrative simulation.

#include <cstdint>
#include <string_view>

namespace nsim::foundation {

/// Error codes grouped by subsystem in 256-value ranges (0x100),
/// so the source of an error can be read from the value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Content (0x0100 - 0x01FF)
    ContentInvalid = 0x0100,
    ContentLoadFailed = 0x0101,
    DuplicateId = 0x0102,

    // Session (0x0200 - 0x02FF)
    NoCharacter = 0x0200,
    RunFinished = 0x0201,
    NoActiveEvent = 0x0202,
    OptionUnavailable = 0x0203,

    // Persistence (0x0300 - 0x03FF)
    SnapshotInvalid = 0x0300,
    SaveFailed = 0x0301,
    LoadFailed = 0x0302,
    SlotOutOfRange = 0x0303,
    SlotEmpty = 0x0304,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Content";
        case 0x0200: return "Session";
        case 0x0300: return "Persistence";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace nsim::foundation

#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the round simulation engine.

#include <cstdint>
#include <string_view>

namespace rse::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    InvalidState = 0x0005,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigValueOutOfRange = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,

    // Map (0x0900 - 0x09FF)
    MapLoadFailed = 0x0900,
    InvalidGeometry = 0x0901,
    UnknownArea = 0x0902,
    NoWalkableArea = 0x0903,

    // Ability (0x0A00 - 0x0AFF)
    InvalidAbilityDefinition = 0x0A00,
    AbilityNotFound = 0x0A01,
    AbilityUnavailable = 0x0A02,

    // Round (0x0B00 - 0x0BFF)
    InvalidRoundSetup = 0x0B00,
    PlayerNotFound = 0x0B01,
    InvalidRoster = 0x0B02,
    MissingMap = 0x0B03,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0900: return "Map";
        case 0x0A00: return "Ability";
        case 0x0B00: return "Round";
        default: return "Unknown";
    }
}

} // namespace rse::foundation

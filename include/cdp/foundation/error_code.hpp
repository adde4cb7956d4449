#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the combat damage pipeline.

#include <cstdint>
#include <string_view>

namespace cdp::foundation {

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
    NotImplemented = 0x0005,

    // Pipeline (0x0100 - 0x01FF)
    PipelineError = 0x0100,
    QueueFull = 0x0101,
    PoolExhausted = 0x0102,

    // Registry (0x0200 - 0x02FF)
    RegistryError = 0x0200,
    EntityNotFound = 0x0201,
    DuplicateEntity = 0x0202,
    InvalidEntityId = 0x0203,
    MissingBinding = 0x0204,

    // Combat (0x0300 - 0x03FF)
    CombatError = 0x0300,
    TargetDead = 0x0301,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Simulation (0x0700 - 0x07FF)
    SimulationError = 0x0700,
    LoopAlreadyRunning = 0x0701,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Pipeline";
        case 0x0200: return "Registry";
        case 0x0300: return "Combat";
        case 0x0600: return "Config";
        case 0x0700: return "Simulation";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace cdp::foundation

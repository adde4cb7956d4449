#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping the kcenon logger interfaces for
///        category-based pipeline logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "cdp/foundation/game_result.hpp"
#include "cdp/foundation/types.hpp"

namespace cdp::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per pipeline subsystem.
enum class LogCategory : uint8_t {
    Core       = 0, ///< Process-level setup and teardown
    Pipeline   = 1, ///< Intake queue and batch draining
    Pool       = 2, ///< Object pool soft-overflow
    Registry   = 3, ///< Entity registration and lifecycle
    Combat     = 4, ///< Damage resolution and request rejection
    Config     = 5, ///< Configuration loading
    Simulation = 6  ///< Fixed-rate loop and drivers
};

inline constexpr std::size_t kLogCategoryCount = 7;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Pipeline", "Pool", "Registry", "Combat", "Config", "Simulation"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.entityId = target;
///   ctx.sourceId = source;
///   ctx.tick = 120;
///   logger.logWithContext(LogLevel::Warning, LogCategory::Combat,
///                         "target already dead", ctx);
/// @endcode
struct LogContext {
    std::optional<EntityId> entityId;
    std::optional<EntityId> sourceId;
    std::optional<uint64_t> tick;
    std::unordered_map<std::string, std::string> extra;
};

/// Pipeline logger wrapping kcenon's logging interfaces.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
/// Messages are routed to the logger registered as "cdp.<Category>" in
/// GlobalLoggerRegistry, falling back to the default logger.
///
/// Default log levels per category:
/// | Category   | Default Level |
/// |------------|---------------|
/// | Core       | Info          |
/// | Pipeline   | Info          |
/// | Pool       | Info          |
/// | Registry   | Info          |
/// | Combat     | Info          |
/// | Config     | Info          |
/// | Simulation | Debug         |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data appended as
    /// key-value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    GameResult<void> flush();

    /// Process-wide logger used by the CDP_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cdp::foundation

// ---------------------------------------------------------------------------
// Convenience macros (defined at global scope)
// ---------------------------------------------------------------------------

/// @name CDP_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// The message expression is only evaluated when the level is enabled,
/// so hot paths can build strings inside the macro argument without
/// paying for them when the category is filtered out.
///
/// CDP_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef CDP_MIN_LOG_LEVEL
    #define CDP_MIN_LOG_LEVEL 0
#endif

#define CDP_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= CDP_MIN_LOG_LEVEL &&                      \
            ::cdp::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::cdp::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define CDP_LOG_DEBUG(cat, msg) \
    CDP_LOG(::cdp::foundation::LogLevel::Debug, (cat), (msg))

#define CDP_LOG_INFO(cat, msg) \
    CDP_LOG(::cdp::foundation::LogLevel::Info, (cat), (msg))

#define CDP_LOG_WARN(cat, msg) \
    CDP_LOG(::cdp::foundation::LogLevel::Warning, (cat), (msg))

#define CDP_LOG_ERROR(cat, msg) \
    CDP_LOG(::cdp::foundation::LogLevel::Error, (cat), (msg))

/// @}

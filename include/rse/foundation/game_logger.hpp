#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping the kcenon common_system logger interfaces.
///
/// Provides category-based filtering for the simulation subsystems,
/// structured logging with round/player context, and per-category
/// runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "rse/foundation/game_result.hpp"
#include "rse/foundation/types.hpp"

namespace rse::foundation {

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

/// Simulation log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Engine setup, configuration
    Map      = 1, ///< Map loading and geometry queries
    Movement = 2, ///< Player physics and collision
    Ability  = 3, ///< Ability instances and status effects
    Combat   = 4, ///< Vision, duels, deaths
    Round    = 5, ///< Phase transitions and spike state
    Economy  = 6, ///< Purchases and carryover
    AI       = 7  ///< Intent providers and blackboards
};

inline constexpr std::size_t kLogCategoryCount = 8;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Map", "Movement", "Ability", "Combat", "Round", "Economy", "AI"
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
///   ctx.playerId = PlayerId(3);
///   ctx.roundNumber = 7;
///   ctx.extra["weapon"] = "Vandal";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Combat,
///                         "Duel resolved", ctx);
/// @endcode
struct LogContext {
    std::optional<PlayerId> playerId;
    std::optional<InstanceId> instanceId;
    std::optional<uint32_t> roundNumber;
    std::optional<double> simTime;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger wrapping kcenon's logging interfaces.
///
/// Uses PIMPL to hide the kcenon headers from the public API.  Each
/// category is routed to a named logger ("rse.<Category>") when one is
/// registered, otherwise to the registry's default logger.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Map      | Info          |
/// | Movement | Info          |
/// | Ability  | Debug         |
/// | Combat   | Debug         |
/// | Round    | Info          |
/// | Economy  | Info          |
/// | AI       | Info          |
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

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    GameResult<void> flush();

    /// Process-wide logger used by the RSE_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rse::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global, outside the namespace)
// ---------------------------------------------------------------------------

/// @name RSE_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// RSE_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef RSE_MIN_LOG_LEVEL
    #define RSE_MIN_LOG_LEVEL 0
#endif

#define RSE_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= RSE_MIN_LOG_LEVEL &&                      \
            ::rse::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::rse::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define RSE_LOG_CTX(level, cat, msg, ctx)                                        \
    do {                                                                         \
        if (static_cast<int>(level) >= RSE_MIN_LOG_LEVEL &&                      \
            ::rse::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::rse::foundation::GameLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                   \
        }                                                                        \
    } while (0)

#define RSE_LOG_DEBUG(cat, msg) \
    RSE_LOG(::rse::foundation::LogLevel::Debug, (cat), (msg))

#define RSE_LOG_INFO(cat, msg) \
    RSE_LOG(::rse::foundation::LogLevel::Info, (cat), (msg))

#define RSE_LOG_WARN(cat, msg) \
    RSE_LOG(::rse::foundation::LogLevel::Warning, (cat), (msg))

#define RSE_LOG_ERROR(cat, msg) \
    RSE_LOG(::rse::foundation::LogLevel::Error, (cat), (msg))

/// @}

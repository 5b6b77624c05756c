#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping kcenon common_system logging for the combat core.
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

#include "arc/foundation/game_result.hpp"
#include "arc/foundation/types.hpp"

namespace arc::foundation {

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

/// Log categories, one per combat-core subsystem.
enum class LogCategory : uint8_t {
    Core   = 0, ///< Session wiring, game loop, startup
    Event  = 1, ///< Event bus dispatch
    Weapon = 2, ///< Weapon state machine, inventory, fire logic
    Combat = 3, ///< Damage resolution, enemy lifecycle
    Player = 4, ///< Player vitals
    World  = 5, ///< Spawning, physics queries
    Config = 6  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 7;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Event", "Weapon", "Combat", "Player", "World", "Config"
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
///   ctx.enemyId = EnemyId(7);
///   ctx.extra["damage"] = "23";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Combat,
///                         "Chain hop", ctx);
/// @endcode
struct LogContext {
    std::optional<EnemyId> enemyId;
    std::optional<std::string> weaponId;
    std::unordered_map<std::string, std::string> extra;
};

/// Combat-core logger wrapping kcenon's logger registry.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
/// Messages are routed to the logger registered under "arc.<Category>",
/// falling back to the registry's default logger.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Event    | Info          |
/// | Weapon   | Debug         |
/// | Combat   | Debug         |
/// | Player   | Info          |
/// | World    | Info          |
/// | Config   | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given level and category.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as {key=val, ...}.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    GameResult<void> flush();

    /// Get the global GameLogger singleton instance.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse a level name ("debug", "WARNING", ...) case-insensitively.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace arc::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace; macros are global)
// ---------------------------------------------------------------------------

/// @name ARC_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// ARC_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef ARC_MIN_LOG_LEVEL
    #define ARC_MIN_LOG_LEVEL 0
#endif

#define ARC_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= ARC_MIN_LOG_LEVEL &&                      \
            ::arc::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::arc::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define ARC_LOG_DEBUG(cat, msg) \
    ARC_LOG(::arc::foundation::LogLevel::Debug, (cat), (msg))

#define ARC_LOG_INFO(cat, msg) \
    ARC_LOG(::arc::foundation::LogLevel::Info, (cat), (msg))

#define ARC_LOG_WARN(cat, msg) \
    ARC_LOG(::arc::foundation::LogLevel::Warning, (cat), (msg))

#define ARC_LOG_ERROR(cat, msg) \
    ARC_LOG(::arc::foundation::LogLevel::Error, (cat), (msg))

/// @}

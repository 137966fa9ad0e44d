#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping the kcenon common logger interfaces.
///
/// Category-based filtering and structured context for the simulation's
/// subsystems. The kcenon registry stays hidden behind a PIMPL.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "nsim/foundation/game_result.hpp"

namespace nsim::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Subsystem categories, each with its own minimum level.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Session lifecycle, config
    Content     = 1, ///< Catalog loading and normalization
    Scheduler   = 2, ///< Event selection and pending queue
    Choice      = 3, ///< Option resolution and follow-ups
    Ending      = 4, ///< Ending resolution and scoring
    Persistence = 5, ///< Snapshots and save slots
    Director    = 6  ///< Turn flow
};

inline constexpr std::size_t kLogCategoryCount = 7;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Content", "Scheduler", "Choice", "Ending", "Persistence", "Director"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

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

/// Structured context appended to a log line.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.day = 3;
///   ctx.period = 0;
///   ctx.eventId = "new_year_morning";
///   ctx.extra["option"] = "get_up_early";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Choice,
///                         "Option applied", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> characterId;
    std::optional<int> day;
    std::optional<int> period;
    std::optional<std::string> eventId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-filtered logger over kcenon's GlobalLoggerRegistry.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | Content     | Info          |
/// | Scheduler   | Debug         |
/// | Choice      | Debug         |
/// | Ending      | Info          |
/// | Persistence | Info          |
/// | Director    | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    GameResult<void> flush();

    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace nsim::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// NSIM_MIN_LOG_LEVEL removes calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
#ifndef NSIM_MIN_LOG_LEVEL
    #define NSIM_MIN_LOG_LEVEL 0
#endif

#define NSIM_LOG(level, cat, msg)                                                 \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= NSIM_MIN_LOG_LEVEL &&                      \
            ::nsim::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                         \
            ::nsim::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define NSIM_LOG_DEBUG(cat, msg) \
    NSIM_LOG(::nsim::foundation::LogLevel::Debug, (cat), (msg))

#define NSIM_LOG_INFO(cat, msg) \
    NSIM_LOG(::nsim::foundation::LogLevel::Info, (cat), (msg))

#define NSIM_LOG_WARN(cat, msg) \
    NSIM_LOG(::nsim::foundation::LogLevel::Warning, (cat), (msg))

#define NSIM_LOG_ERROR(cat, msg) \
    NSIM_LOG(::nsim::foundation::LogLevel::Error, (cat), (msg))

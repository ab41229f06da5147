#pragma once

/// @file game_logger.hpp
/// @brief Per-category log filtering in front of kcenon's GlobalLoggerRegistry.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fxp/foundation/game_result.hpp"

namespace fxp::foundation {

/// Ordered like kcenon::common::interfaces::log_level.
enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warning, Error, Critical, Off };

enum class LogCategory : std::uint8_t {
    Core,        ///< process lifecycle, scheduling
    Ingest,      ///< line source and worker loop
    Parser,      ///< rule compilation and event extraction
    Progression, ///< stats, XP and levels
    Quest,       ///< quest progress, completion and rotation
    Database,    ///< store operations
    Config,
};

struct LogCategoryInfo {
    LogCategory category;
    std::string_view name;
    LogLevel defaultLevel;
};

inline constexpr std::array<LogCategoryInfo, 7> kLogCategories{{
    {LogCategory::Core, "Core", LogLevel::Info},
    {LogCategory::Ingest, "Ingest", LogLevel::Info},
    {LogCategory::Parser, "Parser", LogLevel::Debug},
    {LogCategory::Progression, "Progression", LogLevel::Info},
    {LogCategory::Quest, "Quest", LogLevel::Info},
    {LogCategory::Database, "Database", LogLevel::Info},
    {LogCategory::Config, "Config", LogLevel::Info},
}};

inline constexpr std::size_t kLogCategoryCount = kLogCategories.size();

constexpr std::string_view logCategoryName(LogCategory category) {
    auto idx = static_cast<std::size_t>(category);
    return idx < kLogCategoryCount ? kLogCategories[idx].name : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    constexpr std::array<std::string_view, 7> names{
        "TRACE", "DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL", "OFF"};
    auto idx = static_cast<std::size_t>(level);
    return idx < names.size() ? names[idx] : "UNKNOWN";
}

/// Case-insensitive; accepts "warn" for Warning.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Case-insensitive lookup of a category by name, as used in `logging.*` keys.
[[nodiscard]] std::optional<LogCategory> findLogCategory(std::string_view name);

/// Key/value pairs appended to a message as ` {k=v, k=v}`, in insertion order.
///
/// @code
///   FXP_LOG_FIELDS(LogLevel::Debug, LogCategory::Progression, "event applied",
///                  LogFields().add("actor", "PlayerA").add("xp", 125));
/// @endcode
class LogFields {
public:
    LogFields& add(std::string key, std::string value) {
        fields_.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    LogFields& add(std::string key, std::int64_t value) {
        return add(std::move(key), std::to_string(value));
    }

    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

    [[nodiscard]] std::string render() const;

private:
    std::vector<std::pair<std::string, std::string>> fields_;
};

/// Filters by category level and forwards `[Category] message` to the
/// registry logger named `fxp.<Category>`, or to the default logger when no
/// such logger is registered.
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;

    void log(LogLevel level, LogCategory category, std::string_view message,
             const LogFields& fields = {});

    void setLevel(LogCategory category, LogLevel minimum);

    /// Off for an unknown category.
    [[nodiscard]] LogLevel level(LogCategory category) const;

    [[nodiscard]] bool enabled(LogLevel level, LogCategory category) const;

    GameResult<void> flush();

    /// The instance behind the FXP_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fxp::foundation

/// Calls below FXP_MIN_LOG_LEVEL (0=Trace ... 6=Off) compile to nothing.
#ifndef FXP_MIN_LOG_LEVEL
    #define FXP_MIN_LOG_LEVEL 0
#endif

#define FXP_LOG_FIELDS(level, cat, msg, fields)                                   \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= FXP_MIN_LOG_LEVEL) {                       \
            auto& fxpLogger_ = ::fxp::foundation::GameLogger::instance();         \
            if (fxpLogger_.enabled((level), (cat))) {                             \
                fxpLogger_.log((level), (cat), (msg), (fields));                  \
            }                                                                     \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define FXP_LOG(level, cat, msg) \
    FXP_LOG_FIELDS(level, cat, msg, ::fxp::foundation::LogFields{})

#define FXP_LOG_TRACE(cat, msg) FXP_LOG(::fxp::foundation::LogLevel::Trace, (cat), (msg))
#define FXP_LOG_DEBUG(cat, msg) FXP_LOG(::fxp::foundation::LogLevel::Debug, (cat), (msg))
#define FXP_LOG_INFO(cat, msg) FXP_LOG(::fxp::foundation::LogLevel::Info, (cat), (msg))
#define FXP_LOG_WARN(cat, msg) FXP_LOG(::fxp::foundation::LogLevel::Warning, (cat), (msg))
#define FXP_LOG_ERROR(cat, msg) FXP_LOG(::fxp::foundation::LogLevel::Error, (cat), (msg))

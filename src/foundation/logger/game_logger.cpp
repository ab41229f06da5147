/// @file game_logger.cpp
/// @brief GameLogger on kcenon's GlobalLoggerRegistry.

#include "fxp/foundation/game_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <cctype>

namespace fxp::foundation {

namespace kci = kcenon::common::interfaces;

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

kci::log_level toKcenon(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return kci::log_level::trace;
        case LogLevel::Debug: return kci::log_level::debug;
        case LogLevel::Info: return kci::log_level::info;
        case LogLevel::Warning: return kci::log_level::warning;
        case LogLevel::Error: return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off: return kci::log_level::off;
    }
    return kci::log_level::info;
}

} // namespace

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    if (equalsIgnoreCase(name, "warn")) {
        return LogLevel::Warning;
    }
    for (int i = 0; i <= static_cast<int>(LogLevel::Off); ++i) {
        auto level = static_cast<LogLevel>(i);
        if (equalsIgnoreCase(name, logLevelName(level))) {
            return level;
        }
    }
    return std::nullopt;
}

std::optional<LogCategory> findLogCategory(std::string_view name) {
    for (const auto& info : kLogCategories) {
        if (equalsIgnoreCase(name, info.name)) {
            return info.category;
        }
    }
    return std::nullopt;
}

std::string LogFields::render() const {
    std::string out;
    for (const auto& [key, value] : fields_) {
        out += out.empty() ? "{" : ", ";
        out += key;
        out += '=';
        out += value;
    }
    if (!out.empty()) {
        out += '}';
    }
    return out;
}

struct GameLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> minimum;

    Impl() {
        for (const auto& info : kLogCategories) {
            minimum[static_cast<std::size_t>(info.category)].store(info.defaultLevel);
        }
    }

    static std::shared_ptr<kci::ILogger> route(LogCategory category) {
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto named = registry.get_logger("fxp." + std::string(logCategoryName(category)));
        if (named == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return named;
    }
};

GameLogger::GameLogger() : impl_(std::make_unique<Impl>()) {}

GameLogger::~GameLogger() = default;

void GameLogger::log(LogLevel level, LogCategory category, std::string_view message,
                     const LogFields& fields) {
    if (!enabled(level, category)) {
        return;
    }
    std::string line = "[" + std::string(logCategoryName(category)) + "] ";
    line += message;
    if (!fields.empty()) {
        line += ' ';
        line += fields.render();
    }
    // A sink failure cannot be reported anywhere better than the sink itself.
    (void)Impl::route(category)->log(toKcenon(level), line);
}

void GameLogger::setLevel(LogCategory category, LogLevel minimum) {
    auto idx = static_cast<std::size_t>(category);
    if (idx < kLogCategoryCount) {
        impl_->minimum[idx].store(minimum);
    }
}

LogLevel GameLogger::level(LogCategory category) const {
    auto idx = static_cast<std::size_t>(category);
    return idx < kLogCategoryCount ? impl_->minimum[idx].load() : LogLevel::Off;
}

bool GameLogger::enabled(LogLevel level, LogCategory category) const {
    return level != LogLevel::Off &&
           static_cast<int>(level) >= static_cast<int>(this->level(category));
}

GameResult<void> GameLogger::flush() {
    if (kci::GlobalLoggerRegistry::instance().get_default_logger()->flush().is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerFlushFailed, "default logger did not flush"));
    }
    return GameResult<void>::ok();
}

GameLogger& GameLogger::instance() {
    static GameLogger logger;
    return logger;
}

} // namespace fxp::foundation

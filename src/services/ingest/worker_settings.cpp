/// @file worker_settings.cpp
/// @brief buildWorkerSettings() and applyLogLevels().

#include "fxp/service/worker_settings.hpp"

#include <optional>
#include <utility>
#include <vector>

#include "fxp/foundation/string_utils.hpp"


namespace fxp::service {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

GameResult<WorkerSettings> invalid(std::string message) {
    return GameResult<WorkerSettings>::err(
        GameError(ErrorCode::ConfigInvalidValue, std::move(message)));
}

// Copy an optional key into @p target; a present key of the wrong type is an error.
template <typename T>
std::optional<GameError> readInto(const ConfigManager& config, const std::string& key, T& target) {
    auto value = config.getOr<T>(key, target);
    if (!value) {
        return value.error();
    }
    target = std::move(value).value();
    return std::nullopt;
}

} // namespace

GameResult<WorkerSettings> buildWorkerSettings(const ConfigManager& config) {
    WorkerSettings s;

    std::string logFile = s.source.path.string();
    std::string rulesFile = s.rulesFile.string();
    int pollMs = static_cast<int>(s.source.pollInterval.count());
    int backoffMs = static_cast<int>(s.retry.backoff.count());
    std::string backend = "sqlite";
    std::string connection = s.database.connectionString;
    unsigned int maxConnections = s.database.maxConnections;
    int rotationSeconds = static_cast<int>(s.rotationInterval.count());

    for (auto error : {readInto(config, "ingest.log_file", logFile),
                       readInto(config, "ingest.rules_file", rulesFile),
                       readInto(config, "ingest.poll_interval_ms", pollMs),
                       readInto(config, "ingest.start_at_end", s.source.startAtEnd),
                       readInto(config, "ingest.max_apply_retries", s.retry.maxApplyRetries),
                       readInto(config, "ingest.retry_backoff_ms", backoffMs),
                       readInto(config, "store.backend", backend),
                       readInto(config, "store.connection_string", connection),
                       readInto(config, "store.max_connections", maxConnections),
                       readInto(config, "quests.require_acceptance", s.engine.requireAcceptance),
                       readInto(config, "quests.rotation_interval_seconds", rotationSeconds)}) {
        if (error) {
            return GameResult<WorkerSettings>::err(std::move(*error));
        }
    }

    if (logFile.empty()) {
        return invalid("ingest.log_file must not be empty");
    }
    if (pollMs <= 0) {
        return invalid("ingest.poll_interval_ms must be positive");
    }
    if (s.retry.maxApplyRetries < 0) {
        return invalid("ingest.max_apply_retries must not be negative");
    }
    if (backoffMs < 0) {
        return invalid("ingest.retry_backoff_ms must not be negative");
    }
    if (maxConnections == 0) {
        return invalid("store.max_connections must be positive");
    }
    if (rotationSeconds <= 0) {
        return invalid("quests.rotation_interval_seconds must be positive");
    }

    auto backendName = foundation::toUpperCopy(backend);
    if (backendName == "SQLITE") {
        s.backend = StoreBackend::Sql;
    } else if (backendName == "MEMORY") {
        s.backend = StoreBackend::Memory;
    } else {
        return invalid("store.backend must be 'sqlite' or 'memory', got '" + backend + "'");
    }

    s.source.path = logFile;
    s.source.pollInterval = std::chrono::milliseconds(pollMs);
    s.rulesFile = rulesFile;
    s.retry.backoff = std::chrono::milliseconds(backoffMs);
    s.database.connectionString = connection;
    s.database.maxConnections = maxConnections;
    s.rotationInterval = std::chrono::seconds(rotationSeconds);

    auto awards = progression::XpAwardTable::fromConfig(config);
    if (!awards) {
        return GameResult<WorkerSettings>::err(awards.error());
    }
    s.engine.awards = std::move(awards).value();

    auto rotation = progression::RotationConfig::fromConfig(config);
    if (!rotation) {
        return GameResult<WorkerSettings>::err(rotation.error());
    }
    s.rotation = std::move(rotation).value();

    return GameResult<WorkerSettings>::ok(std::move(s));
}

GameResult<void> applyLogLevels(const ConfigManager& config, foundation::GameLogger& logger) {
    std::vector<std::pair<foundation::LogCategory, foundation::LogLevel>> levels;

    for (const auto& name : config.childKeys("logging")) {
        auto category = foundation::findLogCategory(name);
        if (!category) {
            return GameResult<void>::err(
                GameError(ErrorCode::ConfigInvalidValue, "unknown log category: " + name));
        }

        auto levelName = config.get<std::string>("logging." + name);
        if (!levelName) {
            return GameResult<void>::err(levelName.error());
        }
        auto level = foundation::parseLogLevel(levelName.value());
        if (!level) {
            return GameResult<void>::err(GameError(
                ErrorCode::ConfigInvalidValue,
                "unknown log level '" + levelName.value() + "' for " + name));
        }
        levels.emplace_back(*category, *level);
    }

    for (const auto& [category, level] : levels) {
        logger.setLevel(category, level);
    }
    return GameResult<void>::ok();
}

} // namespace fxp::service

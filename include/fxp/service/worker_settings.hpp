#pragma once

/// @file worker_settings.hpp
/// @brief Ingestion worker settings assembled from the YAML configuration.

#include <chrono>
#include <filesystem>
#include <string>

#include "fxp/foundation/config_manager.hpp"
#include "fxp/foundation/game_database.hpp"
#include "fxp/foundation/game_logger.hpp"
#include "fxp/foundation/game_result.hpp"
#include "fxp/ingest/line_source.hpp"
#include "fxp/progression/progression_engine.hpp"
#include "fxp/progression/quest_rotation.hpp"

namespace fxp::service {

/// Which IProgressionStore implementation to open.
enum class StoreBackend { Sql, Memory };

/// Retry policy for lines whose events fail to apply.
struct RetryPolicy {
    int maxApplyRetries = 3;
    std::chrono::milliseconds backoff{500};
};

/// Everything the ingestion process needs, with defaults for absent keys.
struct WorkerSettings {
    ingest::LineSourceConfig source{"./server.log"};
    std::filesystem::path rulesFile = "./config/rules.yaml";
    RetryPolicy retry;

    StoreBackend backend = StoreBackend::Sql;
    foundation::DatabaseConfig database{"./fika.db"};

    progression::EngineConfig engine;
    progression::RotationConfig rotation{7, progression::RotationConfig::defaultSeeds()};
    std::chrono::seconds rotationInterval{300};
};

/// Read `ingest.*`, `store.*`, `progression.*` and `quests.*`.
/// Type mismatches and invalid values are Config* errors.
[[nodiscard]] foundation::GameResult<WorkerSettings> buildWorkerSettings(
    const foundation::ConfigManager& config);

/// Apply `logging.<category>: <level>` entries. Unknown categories or
/// level names are ConfigInvalidValue; nothing is changed in that case.
[[nodiscard]] foundation::GameResult<void> applyLogLevels(
    const foundation::ConfigManager& config, foundation::GameLogger& logger);

} // namespace fxp::service

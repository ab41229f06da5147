/// @file quest_rotation.cpp
/// @brief QuestRotation implementation.

#include "fxp/progression/quest_rotation.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "fxp/foundation/config_manager.hpp"
#include "fxp/foundation/game_logger.hpp"
#include "fxp/foundation/string_utils.hpp"
#include "fxp/foundation/time_utils.hpp"

namespace fxp::progression {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::LogCategory;

namespace {

GameResult<RotationConfig> invalid(std::string message) {
    return GameResult<RotationConfig>::err(
        GameError(ErrorCode::ConfigInvalidValue, std::move(message)));
}

} // namespace

std::vector<QuestSeed> RotationConfig::defaultSeeds() {
    return {
        QuestSeed{"dogtags_week", "Collect 5 dog tags", "DOGTAG", 5},
        QuestSeed{"survive_week", "Survive 5 raids", "SURVIVE", 5},
    };
}

GameResult<RotationConfig> RotationConfig::fromConfig(const foundation::ConfigManager& config) {
    RotationConfig rc;

    auto days = config.getOr<int>("quests.cycle_days", 7);
    if (!days) {
        return GameResult<RotationConfig>::err(days.error());
    }
    if (days.value() <= 0) {
        return invalid("quests.cycle_days must be positive");
    }
    rc.cycleDays = days.value();

    if (!config.hasKey("quests.seeds")) {
        rc.seeds = defaultSeeds();
        return GameResult<RotationConfig>::ok(std::move(rc));
    }

    auto node = config.get<YAML::Node>("quests.seeds");
    if (!node) {
        return GameResult<RotationConfig>::err(node.error());
    }
    if (!node.value().IsSequence()) {
        return invalid("quests.seeds must be a list");
    }

    for (const auto& entry : node.value()) {
        if (!entry.IsMap()) {
            return invalid("each quest seed must be a mapping");
        }
        QuestSeed seed;
        try {
            seed.key = foundation::trimCopy(entry["key"].as<std::string>(""));
            seed.title = foundation::trimCopy(entry["title"].as<std::string>(""));
            seed.eventType =
                foundation::toUpperCopy(foundation::trimCopy(entry["event_type"].as<std::string>("")));
            seed.target = entry["target"].as<std::int64_t>(0);
        } catch (const YAML::Exception& e) {
            return invalid(std::string("malformed quest seed: ") + e.what());
        }
        if (seed.key.empty() || seed.title.empty() || seed.eventType.empty()) {
            return invalid("quest seed needs key, title and event_type");
        }
        if (seed.key.find('@') != std::string::npos) {
            return invalid("quest seed key must not contain '@': " + seed.key);
        }
        if (seed.target <= 0) {
            return invalid("quest seed " + seed.key + " needs a positive target");
        }
        auto dup = std::find_if(rc.seeds.begin(), rc.seeds.end(),
                                [&](const QuestSeed& s) { return s.key == seed.key; });
        if (dup != rc.seeds.end()) {
            return invalid("duplicate quest seed key " + seed.key);
        }
        rc.seeds.push_back(std::move(seed));
    }
    return GameResult<RotationConfig>::ok(std::move(rc));
}

QuestRotation::QuestRotation(IProgressionStore& store, RotationConfig config)
    : store_(store), config_(std::move(config)) {}

std::string QuestRotation::cycleKey(const QuestSeed& seed, foundation::Timestamp now) const {
    return seed.key + "@" +
           foundation::formatDate(foundation::floorToDayCycle(now, config_.cycleDays));
}

GameResult<RotationReport> QuestRotation::rotate(foundation::Timestamp now) {
    using Report = GameResult<RotationReport>;

    auto txnResult = store_.beginTransaction();
    if (!txnResult) {
        return Report::err(txnResult.error());
    }
    auto& txn = *txnResult.value();

    RotationReport report;
    auto deactivated = txn.deactivateExpired(now);
    if (!deactivated) {
        return Report::err(deactivated.error());
    }
    report.deactivated = deactivated.value();

    auto active = txn.listQuests(true);
    if (!active) {
        return Report::err(active.error());
    }
    report.active = active.value().size();

    if (report.active == 0) {
        auto start = foundation::floorToDayCycle(now, config_.cycleDays);
        auto end = start + std::chrono::days(config_.cycleDays);
        for (const auto& seed : config_.seeds) {
            Quest quest;
            quest.key = cycleKey(seed, now);
            quest.title = seed.title;
            quest.eventType = seed.eventType;
            quest.target = seed.target;
            quest.start = start;
            quest.end = end;
            quest.active = true;

            auto inserted = txn.insertQuestIfAbsent(quest);
            if (!inserted) {
                return Report::err(inserted.error());
            }
            if (inserted.value()) {
                report.seeded.push_back(quest.key);
            }
        }

        auto after = txn.listQuests(true);
        if (!after) {
            return Report::err(after.error());
        }
        report.active = after.value().size();
    }

    if (auto committed = txn.commit(); !committed) {
        return Report::err(committed.error());
    }

    if (report.deactivated > 0 || !report.seeded.empty()) {
        FXP_LOG_INFO(LogCategory::Quest,
                     "quest rotation: " + std::to_string(report.deactivated) + " expired, " +
                     std::to_string(report.seeded.size()) + " seeded, " +
                     std::to_string(report.active) + " active");
    } else {
        FXP_LOG_DEBUG(LogCategory::Quest,
                      "quest rotation: " + std::to_string(report.active) + " active, nothing to do");
    }
    return Report::ok(std::move(report));
}

} // namespace fxp::progression

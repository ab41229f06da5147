/// @file leveling.cpp
/// @brief XpAwardTable construction.

#include "fxp/progression/leveling.hpp"

#include "fxp/foundation/config_manager.hpp"
#include "fxp/foundation/game_logger.hpp"
#include "fxp/foundation/string_utils.hpp"
#include "fxp/ingest/event.hpp"

namespace fxp::progression {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {
constexpr std::string_view kAwardsSection = "progression.xp_awards";
} // namespace

XpAwardTable::XpAwardTable()
    : awards_{
          {std::string(ingest::event_type::kKill), 100},
          {std::string(ingest::event_type::kHeadshot), 25},
          {std::string(ingest::event_type::kSurvive), 150},
          {std::string(ingest::event_type::kExtract), 75},
          {std::string(ingest::event_type::kDogtag), 30},
          {std::string(ingest::event_type::kDeath), 0},
      } {}

GameResult<XpAwardTable> XpAwardTable::fromMap(const std::map<std::string, std::int64_t>& awards) {
    XpAwardTable table;
    table.awards_.clear();
    for (const auto& [type, xp] : awards) {
        auto key = foundation::toUpperCopy(foundation::trimCopy(type));
        if (key.empty()) {
            return GameResult<XpAwardTable>::err(
                GameError(ErrorCode::ConfigInvalidValue, "empty event type in XP award table"));
        }
        if (xp < 0) {
            return GameResult<XpAwardTable>::err(GameError(
                ErrorCode::ConfigInvalidValue,
                "negative XP award for " + key + ": " + std::to_string(xp)));
        }
        table.awards_[key] = xp;
    }
    return GameResult<XpAwardTable>::ok(std::move(table));
}

GameResult<XpAwardTable> XpAwardTable::fromConfig(const foundation::ConfigManager& config) {
    auto types = config.childKeys(kAwardsSection);
    if (types.empty()) {
        if (config.hasKey(kAwardsSection)) {
            return GameResult<XpAwardTable>::err(GameError(
                ErrorCode::ConfigInvalidValue,
                std::string(kAwardsSection) + " must be a mapping of event type to XP"));
        }
        return GameResult<XpAwardTable>::ok(XpAwardTable());
    }

    std::map<std::string, std::int64_t> awards;
    for (const auto& type : types) {
        auto xp = config.get<std::int64_t>(std::string(kAwardsSection) + "." + type);
        if (!xp) {
            return GameResult<XpAwardTable>::err(xp.error());
        }
        awards[type] = xp.value();
    }

    auto table = fromMap(awards);
    if (table) {
        FXP_LOG_INFO(foundation::LogCategory::Config,
                     "loaded XP award table with " + std::to_string(awards.size()) + " entries");
    }
    return table;
}

std::int64_t XpAwardTable::awardFor(std::string_view eventType) const {
    auto it = awards_.find(foundation::toUpperCopy(eventType));
    return it != awards_.end() ? it->second : 0;
}

} // namespace fxp::progression

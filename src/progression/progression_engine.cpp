/// @file progression_engine.cpp
/// @brief ProgressionEngine implementation.

#include "fxp/progression/progression_engine.hpp"

#include <utility>

#include "fxp/foundation/game_logger.hpp"

namespace fxp::progression {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::LogCategory;
using foundation::LogFields;
using foundation::LogLevel;

ProgressionEngine::ProgressionEngine(IProgressionStore& store, EngineConfig config,
                                     foundation::Clock clock)
    : store_(store), config_(std::move(config)), clock_(std::move(clock)) {}

GameResult<ApplyOutcome> ProgressionEngine::apply(const ingest::Event& event) {
    using Outcome = GameResult<ApplyOutcome>;

    if (event.actor.empty() || event.type.empty()) {
        return Outcome::err(GameError(ErrorCode::InvalidEvent,
                                      "event without actor or type rejected"));
    }

    auto txnResult = store_.beginTransaction();
    if (!txnResult) {
        return Outcome::err(txnResult.error());
    }
    auto& txn = *txnResult.value();

    ApplyOutcome outcome;
    auto identity = ingest::identityKey(event);

    auto seen = txn.hasEvent(identity);
    if (!seen) {
        return Outcome::err(seen.error());
    }
    if (seen.value()) {
        FXP_LOG_DEBUG(LogCategory::Progression, "skipping already applied event " + identity);
        return Outcome::ok(std::move(outcome));
    }

    auto now = clock_();

    // 1-2
    auto player = txn.upsertPlayer(event.actor, now);
    if (!player) {
        return Outcome::err(player.error());
    }
    outcome.playerId = player.value().id;

    auto statsResult = txn.ensureStats(outcome.playerId);
    if (!statsResult) {
        return Outcome::err(statsResult.error());
    }
    PlayerStats stats = statsResult.value();
    outcome.levelBefore = stats.level;
    outcome.levelAfter = stats.level;

    // 3
    if (auto logged = txn.appendEvent(event, identity); !logged) {
        return Outcome::err(logged.error());
    }

    // 4
    if (auto counter = counterForEventType(event.type)) {
        increment(stats, *counter);
    }

    // 5
    if (player.value().eligible) {
        auto award = config_.awards.awardFor(event.type);
        if (award > 0) {
            stats.xp += award;
            outcome.xpAwarded = award;
            auto level = levelFromXp(stats.xp);
            if (level > stats.level) {
                stats.level = level;
            }
            outcome.levelAfter = stats.level;
        }
    }

    if (auto saved = txn.saveStats(outcome.playerId, stats); !saved) {
        return Outcome::err(saved.error());
    }

    // 6-7
    if (auto advanced = advanceQuests(txn, event, player.value(), now, outcome); !advanced) {
        return Outcome::err(advanced.error());
    }

    if (auto committed = txn.commit(); !committed) {
        return Outcome::err(committed.error());
    }
    outcome.applied = true;

    FXP_LOG_FIELDS(LogLevel::Debug, LogCategory::Progression, "event applied",
                   LogFields()
                       .add("player_id", outcome.playerId.value())
                       .add("actor", event.actor)
                       .add("type", event.type)
                       .add("xp", outcome.xpAwarded));

    if (outcome.leveledUp()) {
        FXP_LOG_INFO(LogCategory::Progression,
                     event.actor + " reached level " + std::to_string(outcome.levelAfter) +
                     " (" + std::to_string(stats.xp) + " XP)");
    }
    for (const auto& key : outcome.completedQuests) {
        FXP_LOG_FIELDS(LogLevel::Info, LogCategory::Quest, event.actor + " completed a quest",
                       LogFields().add("player_id", outcome.playerId.value()).add("quest", key));
    }
    return Outcome::ok(std::move(outcome));
}

GameResult<void> ProgressionEngine::advanceQuests(IProgressionTransaction& txn,
                                                  const ingest::Event& event,
                                                  const PlayerRecord& player,
                                                  foundation::Timestamp now,
                                                  ApplyOutcome& outcome) {
    auto quests = txn.listQuests(true);
    if (!quests) {
        return GameResult<void>::err(quests.error());
    }

    for (const auto& quest : quests.value()) {
        if (quest.eventType != event.type || !quest.isLiveAt(now)) {
            continue;
        }

        QuestProgress progress;
        if (config_.requireAcceptance) {
            auto existing = txn.findProgress(player.id, quest.id);
            if (!existing) {
                return GameResult<void>::err(existing.error());
            }
            if (!existing.value()) {
                continue;
            }
            progress = *existing.value();
        } else {
            auto ensured = txn.ensureProgress(player.id, quest.id);
            if (!ensured) {
                return GameResult<void>::err(ensured.error());
            }
            progress = ensured.value();
        }

        progress.progress += 1;
        if (auto saved = txn.saveProgress(progress); !saved) {
            return saved;
        }
    }

    // Completion covers every active quest the player holds, not only the ones
    // this event advanced: a target lowered by an admin takes effect here.
    for (const auto& quest : quests.value()) {
        auto existing = txn.findProgress(player.id, quest.id);
        if (!existing) {
            return GameResult<void>::err(existing.error());
        }
        if (!existing.value()) {
            continue;
        }
        auto progress = *existing.value();
        if (progress.progress < quest.target || progress.completedAt) {
            continue;
        }
        progress.completedAt = now;
        outcome.completedQuests.push_back(quest.key);
        if (auto saved = txn.saveProgress(progress); !saved) {
            return saved;
        }
    }
    return GameResult<void>::ok();
}

} // namespace fxp::progression

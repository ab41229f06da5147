/// @file progression_admin.cpp
/// @brief ProgressionAdmin implementation.

#include "fxp/progression/progression_admin.hpp"

#include <utility>

#include "fxp/foundation/game_logger.hpp"
#include "fxp/foundation/string_utils.hpp"

namespace fxp::progression {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::LogCategory;

namespace {

GameError questInvalid(std::string message) {
    return GameError(ErrorCode::QuestInvalid, std::move(message));
}

GameError questNotFound(std::string_view key) {
    return GameError(ErrorCode::QuestNotFound, "quest not found: " + std::string(key));
}

// Empty optional when the quest is valid, otherwise the reason.
std::optional<GameError> validate(const Quest& quest) {
    if (quest.key.empty()) {
        return questInvalid("quest key must not be empty");
    }
    if (quest.title.empty()) {
        return questInvalid("quest title must not be empty");
    }
    if (quest.eventType.empty()) {
        return questInvalid("quest event type must not be empty");
    }
    if (quest.target <= 0) {
        return questInvalid("quest target must be positive");
    }
    if (quest.end <= quest.start) {
        return questInvalid("quest window must end after it starts");
    }
    return std::nullopt;
}

} // namespace

ProgressionAdmin::ProgressionAdmin(IProgressionStore& store, foundation::Clock clock)
    : store_(store), clock_(std::move(clock)) {}

GameResult<PlayerRecord> ProgressionAdmin::setEligible(std::string_view displayName,
                                                       bool eligible) {
    using Player = GameResult<PlayerRecord>;

    auto txnResult = store_.beginTransaction();
    if (!txnResult) {
        return Player::err(txnResult.error());
    }
    auto& txn = *txnResult.value();

    auto player = txn.findPlayer(displayName);
    if (!player) {
        return Player::err(player.error());
    }
    if (!player.value()) {
        return Player::err(GameError(ErrorCode::PlayerNotFound,
                                     "unknown player: " + std::string(displayName)));
    }

    PlayerRecord record = *player.value();
    if (auto updated = txn.setEligible(record.id, eligible); !updated) {
        return Player::err(updated.error());
    }
    if (auto committed = txn.commit(); !committed) {
        return Player::err(committed.error());
    }

    record.eligible = eligible;
    FXP_LOG_INFO(LogCategory::Progression,
                 record.displayName + (eligible ? " opted in to XP" : " opted out of XP"));
    return Player::ok(std::move(record));
}

GameResult<QuestProgress> ProgressionAdmin::acceptQuest(std::string_view displayName,
                                                        std::string_view questKey) {
    using Progress = GameResult<QuestProgress>;

    auto txnResult = store_.beginTransaction();
    if (!txnResult) {
        return Progress::err(txnResult.error());
    }
    auto& txn = *txnResult.value();

    auto player = txn.findPlayer(displayName);
    if (!player) {
        return Progress::err(player.error());
    }
    if (!player.value()) {
        return Progress::err(GameError(ErrorCode::PlayerNotFound,
                                       "unknown player: " + std::string(displayName)));
    }

    auto quest = txn.findQuest(questKey);
    if (!quest) {
        return Progress::err(quest.error());
    }
    if (!quest.value()) {
        return Progress::err(questNotFound(questKey));
    }
    if (!quest.value()->isLiveAt(clock_())) {
        return Progress::err(questInvalid("quest " + std::string(questKey) + " is not active"));
    }

    auto progress = txn.ensureProgress(player.value()->id, quest.value()->id);
    if (!progress) {
        return Progress::err(progress.error());
    }
    if (auto committed = txn.commit(); !committed) {
        return Progress::err(committed.error());
    }

    FXP_LOG_INFO(LogCategory::Quest,
                 std::string(displayName) + " accepted quest " + std::string(questKey));
    return progress;
}

GameResult<Quest> ProgressionAdmin::createQuest(const QuestDraft& draft) {
    Quest quest;
    quest.key = foundation::trimCopy(draft.key);
    quest.title = foundation::trimCopy(draft.title);
    quest.eventType = foundation::toUpperCopy(foundation::trimCopy(draft.eventType));
    quest.target = draft.target;
    quest.start = draft.start;
    quest.end = draft.end;
    quest.active = draft.active;

    if (auto invalid = validate(quest)) {
        return GameResult<Quest>::err(std::move(*invalid));
    }

    auto txnResult = store_.beginTransaction();
    if (!txnResult) {
        return GameResult<Quest>::err(txnResult.error());
    }
    auto& txn = *txnResult.value();

    auto created = txn.createQuest(quest);
    if (!created) {
        return created;
    }
    if (auto committed = txn.commit(); !committed) {
        return GameResult<Quest>::err(committed.error());
    }

    FXP_LOG_INFO(LogCategory::Quest, "created quest " + created.value().key);
    return created;
}

GameResult<Quest> ProgressionAdmin::updateQuest(std::string_view questKey,
                                                const QuestUpdate& update) {
    auto txnResult = store_.beginTransaction();
    if (!txnResult) {
        return GameResult<Quest>::err(txnResult.error());
    }
    auto& txn = *txnResult.value();

    auto found = txn.findQuest(questKey);
    if (!found) {
        return GameResult<Quest>::err(found.error());
    }
    if (!found.value()) {
        return GameResult<Quest>::err(questNotFound(questKey));
    }

    Quest quest = *found.value();
    if (update.title) {
        quest.title = foundation::trimCopy(*update.title);
    }
    if (update.eventType) {
        quest.eventType = foundation::toUpperCopy(foundation::trimCopy(*update.eventType));
    }
    if (update.target) {
        quest.target = *update.target;
    }
    if (update.start) {
        quest.start = *update.start;
    }
    if (update.end) {
        quest.end = *update.end;
    }
    if (update.active) {
        quest.active = *update.active;
    }

    if (auto invalid = validate(quest)) {
        return GameResult<Quest>::err(std::move(*invalid));
    }
    if (auto saved = txn.updateQuest(quest); !saved) {
        return GameResult<Quest>::err(saved.error());
    }
    if (auto committed = txn.commit(); !committed) {
        return GameResult<Quest>::err(committed.error());
    }

    FXP_LOG_INFO(LogCategory::Quest, "updated quest " + quest.key);
    return GameResult<Quest>::ok(std::move(quest));
}

GameResult<void> ProgressionAdmin::deleteQuest(std::string_view questKey) {
    auto txnResult = store_.beginTransaction();
    if (!txnResult) {
        return GameResult<void>::err(txnResult.error());
    }
    auto& txn = *txnResult.value();

    auto found = txn.findQuest(questKey);
    if (!found) {
        return GameResult<void>::err(found.error());
    }
    if (!found.value()) {
        return GameResult<void>::err(questNotFound(questKey));
    }
    if (auto removed = txn.deleteQuest(found.value()->id); !removed) {
        return removed;
    }
    if (auto committed = txn.commit(); !committed) {
        return committed;
    }

    FXP_LOG_INFO(LogCategory::Quest, "deleted quest " + std::string(questKey));
    return GameResult<void>::ok();
}

GameResult<std::vector<Quest>> ProgressionAdmin::listQuests(bool activeOnly) {
    return store_.listQuests(activeOnly);
}

} // namespace fxp::progression

/// @file in_memory_progression_store.cpp
/// @brief InMemoryProgressionStore implementation.

#include "fxp/progression/in_memory_progression_store.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "fxp/foundation/game_logger.hpp"

namespace fxp::progression {

using foundation::ErrorCode;
using foundation::GameError;

namespace {

struct StoreState {
    std::map<std::int64_t, PlayerRecord> players;
    std::unordered_map<std::string, std::int64_t> playerByName;
    std::map<std::int64_t, PlayerStats> stats;
    std::map<std::int64_t, Quest> quests;
    std::unordered_map<std::string, std::int64_t> questByKey;
    std::map<std::pair<std::int64_t, std::int64_t>, QuestProgress> progress;
    std::int64_t nextPlayerId = 1;
    std::int64_t nextQuestId = 1;
};

struct EventLog {
    std::vector<EventLogEntry> entries;
    std::unordered_set<std::string> identities;
};

template <typename T>
GameResult<T> ok(T value) {
    return GameResult<T>::ok(std::move(value));
}

// ----- reads over a state snapshot -----------------------------------------

std::optional<PlayerRecord> readPlayer(const StoreState& s, std::string_view name) {
    auto it = s.playerByName.find(std::string(name));
    if (it == s.playerByName.end()) {
        return std::nullopt;
    }
    return s.players.at(it->second);
}

std::optional<PlayerStats> readStats(const StoreState& s, PlayerId player) {
    auto it = s.stats.find(player.value());
    if (it == s.stats.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PlayerCard> readTopPlayers(const StoreState& s, std::size_t limit) {
    std::vector<PlayerCard> cards;
    cards.reserve(s.stats.size());
    for (const auto& [id, stats] : s.stats) {
        cards.push_back(PlayerCard{s.players.at(id), stats});
    }
    std::sort(cards.begin(), cards.end(), [](const PlayerCard& a, const PlayerCard& b) {
        if (a.stats.xp != b.stats.xp) {
            return a.stats.xp > b.stats.xp;
        }
        return a.player.displayName < b.player.displayName;
    });
    if (cards.size() > limit) {
        cards.resize(limit);
    }
    return cards;
}

std::optional<Quest> readQuest(const StoreState& s, std::string_view key) {
    auto it = s.questByKey.find(std::string(key));
    if (it == s.questByKey.end()) {
        return std::nullopt;
    }
    return s.quests.at(it->second);
}

std::vector<Quest> readQuests(const StoreState& s, bool activeOnly) {
    std::vector<Quest> quests;
    for (const auto& [id, quest] : s.quests) {
        if (!activeOnly || quest.active) {
            quests.push_back(quest);
        }
    }
    return quests;
}

std::optional<QuestProgress> readProgress(const StoreState& s, PlayerId player, QuestId quest) {
    auto it = s.progress.find({player.value(), quest.value()});
    if (it == s.progress.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<QuestStanding> readStandings(const StoreState& s, QuestId quest) {
    std::vector<QuestStanding> standings;
    for (const auto& [key, row] : s.progress) {
        if (key.second != quest.value()) {
            continue;
        }
        const auto& player = s.players.at(key.first);
        standings.push_back(QuestStanding{player.id, player.displayName, row.progress,
                                          row.completedAt});
    }
    std::sort(standings.begin(), standings.end(),
              [](const QuestStanding& a, const QuestStanding& b) {
                  if (a.progress != b.progress) {
                      return a.progress > b.progress;
                  }
                  return a.displayName < b.displayName;
              });
    return standings;
}

std::vector<EventLogEntry> readRecent(const EventLog& committed,
                                      const std::vector<EventLogEntry>* staged,
                                      std::size_t limit) {
    std::vector<EventLogEntry> recent;
    if (staged != nullptr) {
        for (auto it = staged->rbegin(); it != staged->rend() && recent.size() < limit; ++it) {
            recent.push_back(*it);
        }
    }
    for (auto it = committed.entries.rbegin();
         it != committed.entries.rend() && recent.size() < limit; ++it) {
        recent.push_back(*it);
    }
    return recent;
}

} // namespace

struct InMemoryProgressionStore::Impl {
    std::mutex writerMutex;
    std::shared_mutex stateMutex;
    StoreState state;
    EventLog log;
};

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------

namespace {

class InMemoryTransaction final : public IProgressionTransaction {
public:
    explicit InMemoryTransaction(std::shared_ptr<InMemoryProgressionStore::Impl> impl)
        : impl_(std::move(impl)), writerLock_(impl_->writerMutex) {
        std::shared_lock lock(impl_->stateMutex);
        working_ = impl_->state;
        nextEventId_ = static_cast<std::int64_t>(impl_->log.entries.size()) + 1;
    }

    ~InMemoryTransaction() override { rollback(); }

    // --- reads ---

    GameResult<std::optional<PlayerRecord>> findPlayer(std::string_view name) override {
        return ok(readPlayer(working_, name));
    }

    GameResult<std::optional<PlayerStats>> findStats(PlayerId player) override {
        return ok(readStats(working_, player));
    }

    GameResult<std::vector<PlayerCard>> topPlayers(std::size_t limit) override {
        return ok(readTopPlayers(working_, limit));
    }

    GameResult<std::optional<Quest>> findQuest(std::string_view key) override {
        return ok(readQuest(working_, key));
    }

    GameResult<std::vector<Quest>> listQuests(bool activeOnly) override {
        return ok(readQuests(working_, activeOnly));
    }

    GameResult<std::optional<QuestProgress>> findProgress(PlayerId player, QuestId quest) override {
        return ok(readProgress(working_, player, quest));
    }

    GameResult<std::vector<QuestStanding>> questStandings(QuestId quest) override {
        return ok(readStandings(working_, quest));
    }

    GameResult<bool> hasEvent(std::string_view identity) override {
        std::string key(identity);
        if (stagedIdentities_.count(key) != 0) {
            return ok(true);
        }
        std::shared_lock lock(impl_->stateMutex);
        return ok(impl_->log.identities.count(key) != 0);
    }

    GameResult<std::vector<EventLogEntry>> recentEvents(std::size_t limit) override {
        std::shared_lock lock(impl_->stateMutex);
        return ok(readRecent(impl_->log, &stagedEvents_, limit));
    }

    // --- writes ---

    GameResult<PlayerRecord> upsertPlayer(std::string_view name, Timestamp seen) override {
        if (auto active = checkActive(); !active) {
            return GameResult<PlayerRecord>::err(active.error());
        }
        auto it = working_.playerByName.find(std::string(name));
        if (it != working_.playerByName.end()) {
            auto& player = working_.players.at(it->second);
            player.lastSeen = seen;
            return ok(player);
        }
        PlayerRecord player;
        player.id = PlayerId(working_.nextPlayerId++);
        player.displayName = std::string(name);
        player.lastSeen = seen;
        working_.playerByName.emplace(player.displayName, player.id.value());
        working_.players.emplace(player.id.value(), player);
        return ok(player);
    }

    GameResult<PlayerStats> ensureStats(PlayerId player) override {
        if (auto active = checkActive(); !active) {
            return GameResult<PlayerStats>::err(active.error());
        }
        if (working_.players.count(player.value()) == 0) {
            return GameResult<PlayerStats>::err(playerNotFound(player));
        }
        auto [it, inserted] = working_.stats.try_emplace(player.value());
        return ok(it->second);
    }

    GameResult<void> saveStats(PlayerId player, const PlayerStats& stats) override {
        if (auto active = checkActive(); !active) {
            return active;
        }
        if (working_.players.count(player.value()) == 0) {
            return GameResult<void>::err(playerNotFound(player));
        }
        working_.stats[player.value()] = stats;
        return GameResult<void>::ok();
    }

    GameResult<void> setEligible(PlayerId player, bool eligible) override {
        if (auto active = checkActive(); !active) {
            return active;
        }
        auto it = working_.players.find(player.value());
        if (it == working_.players.end()) {
            return GameResult<void>::err(playerNotFound(player));
        }
        it->second.eligible = eligible;
        return GameResult<void>::ok();
    }

    GameResult<EventId> appendEvent(const ingest::Event& event,
                                    std::string_view identity) override {
        if (auto active = checkActive(); !active) {
            return GameResult<EventId>::err(active.error());
        }
        EventLogEntry entry{EventId(nextEventId_++), std::string(identity), event};
        stagedIdentities_.insert(entry.identity);
        stagedEvents_.push_back(entry);
        return ok(entry.id);
    }

    GameResult<Quest> createQuest(const Quest& quest) override {
        if (auto active = checkActive(); !active) {
            return GameResult<Quest>::err(active.error());
        }
        if (working_.questByKey.count(quest.key) != 0) {
            return GameResult<Quest>::err(
                GameError(ErrorCode::AlreadyExists, "quest key already exists: " + quest.key));
        }
        Quest stored = quest;
        stored.id = QuestId(working_.nextQuestId++);
        working_.questByKey.emplace(stored.key, stored.id.value());
        working_.quests.emplace(stored.id.value(), stored);
        return ok(stored);
    }

    GameResult<bool> insertQuestIfAbsent(const Quest& quest) override {
        if (working_.questByKey.count(quest.key) != 0) {
            return ok(false);
        }
        auto created = createQuest(quest);
        if (!created) {
            return GameResult<bool>::err(created.error());
        }
        return ok(true);
    }

    GameResult<void> updateQuest(const Quest& quest) override {
        if (auto active = checkActive(); !active) {
            return active;
        }
        auto it = working_.quests.find(quest.id.value());
        if (it == working_.quests.end()) {
            return GameResult<void>::err(questNotFound(quest.id));
        }
        auto& stored = it->second;
        stored.title = quest.title;
        stored.eventType = quest.eventType;
        stored.target = quest.target;
        stored.start = quest.start;
        stored.end = quest.end;
        stored.active = quest.active;
        return GameResult<void>::ok();
    }

    GameResult<void> deleteQuest(QuestId quest) override {
        if (auto active = checkActive(); !active) {
            return active;
        }
        auto it = working_.quests.find(quest.value());
        if (it == working_.quests.end()) {
            return GameResult<void>::err(questNotFound(quest));
        }
        working_.questByKey.erase(it->second.key);
        working_.quests.erase(it);
        for (auto p = working_.progress.begin(); p != working_.progress.end();) {
            p = p->first.second == quest.value() ? working_.progress.erase(p) : std::next(p);
        }
        return GameResult<void>::ok();
    }

    GameResult<std::size_t> deactivateExpired(Timestamp now) override {
        if (auto active = checkActive(); !active) {
            return GameResult<std::size_t>::err(active.error());
        }
        std::size_t count = 0;
        for (auto& [id, quest] : working_.quests) {
            if (quest.active && quest.end <= now) {
                quest.active = false;
                ++count;
            }
        }
        return ok(count);
    }

    GameResult<QuestProgress> ensureProgress(PlayerId player, QuestId quest) override {
        if (auto active = checkActive(); !active) {
            return GameResult<QuestProgress>::err(active.error());
        }
        if (working_.players.count(player.value()) == 0) {
            return GameResult<QuestProgress>::err(playerNotFound(player));
        }
        if (working_.quests.count(quest.value()) == 0) {
            return GameResult<QuestProgress>::err(questNotFound(quest));
        }
        auto [it, inserted] = working_.progress.try_emplace(
            std::make_pair(player.value(), quest.value()),
            QuestProgress{player, quest, 0, std::nullopt});
        return ok(it->second);
    }

    GameResult<void> saveProgress(const QuestProgress& progress) override {
        if (auto active = checkActive(); !active) {
            return active;
        }
        auto it = working_.progress.find({progress.playerId.value(), progress.questId.value()});
        if (it == working_.progress.end()) {
            return GameResult<void>::err(GameError(
                ErrorCode::NotFound, "no progress row for player " +
                                         std::to_string(progress.playerId.value()) + " on quest " +
                                         std::to_string(progress.questId.value())));
        }
        it->second = progress;
        return GameResult<void>::ok();
    }

    GameResult<void> commit() override {
        if (auto active = checkActive(); !active) {
            return active;
        }
        {
            std::unique_lock lock(impl_->stateMutex);
            impl_->state = std::move(working_);
            for (auto& entry : stagedEvents_) {
                impl_->log.identities.insert(entry.identity);
                impl_->log.entries.push_back(std::move(entry));
            }
        }
        finish();
        return GameResult<void>::ok();
    }

    void rollback() override {
        if (active_) {
            finish();
        }
    }

private:
    GameResult<void> checkActive() const {
        if (!active_) {
            return GameResult<void>::err(
                GameError(ErrorCode::TransactionFailed, "transaction not active"));
        }
        return GameResult<void>::ok();
    }

    static GameError playerNotFound(PlayerId player) {
        return GameError(ErrorCode::PlayerNotFound,
                         "player " + std::to_string(player.value()) + " not found");
    }

    static GameError questNotFound(QuestId quest) {
        return GameError(ErrorCode::QuestNotFound,
                         "quest " + std::to_string(quest.value()) + " not found");
    }

    void finish() {
        active_ = false;
        stagedEvents_.clear();
        stagedIdentities_.clear();
        working_ = StoreState{};
        if (writerLock_.owns_lock()) {
            writerLock_.unlock();
        }
    }

    std::shared_ptr<InMemoryProgressionStore::Impl> impl_;
    std::unique_lock<std::mutex> writerLock_;
    StoreState working_;
    std::vector<EventLogEntry> stagedEvents_;
    std::unordered_set<std::string> stagedIdentities_;
    std::int64_t nextEventId_ = 1;
    bool active_ = true;
};

} // namespace

// ---------------------------------------------------------------------------
// InMemoryProgressionStore
// ---------------------------------------------------------------------------

InMemoryProgressionStore::InMemoryProgressionStore()
    : impl_(std::make_shared<Impl>()) {}

InMemoryProgressionStore::~InMemoryProgressionStore() = default;

GameResult<std::unique_ptr<IProgressionTransaction>> InMemoryProgressionStore::beginTransaction() {
    return GameResult<std::unique_ptr<IProgressionTransaction>>::ok(
        std::make_unique<InMemoryTransaction>(impl_));
}

GameResult<std::optional<PlayerRecord>> InMemoryProgressionStore::findPlayer(
    std::string_view displayName) {
    std::shared_lock lock(impl_->stateMutex);
    return ok(readPlayer(impl_->state, displayName));
}

GameResult<std::optional<PlayerStats>> InMemoryProgressionStore::findStats(PlayerId player) {
    std::shared_lock lock(impl_->stateMutex);
    return ok(readStats(impl_->state, player));
}

GameResult<std::vector<PlayerCard>> InMemoryProgressionStore::topPlayers(std::size_t limit) {
    std::shared_lock lock(impl_->stateMutex);
    return ok(readTopPlayers(impl_->state, limit));
}

GameResult<std::optional<Quest>> InMemoryProgressionStore::findQuest(std::string_view key) {
    std::shared_lock lock(impl_->stateMutex);
    return ok(readQuest(impl_->state, key));
}

GameResult<std::vector<Quest>> InMemoryProgressionStore::listQuests(bool activeOnly) {
    std::shared_lock lock(impl_->stateMutex);
    return ok(readQuests(impl_->state, activeOnly));
}

GameResult<std::optional<QuestProgress>> InMemoryProgressionStore::findProgress(PlayerId player,
                                                                                QuestId quest) {
    std::shared_lock lock(impl_->stateMutex);
    return ok(readProgress(impl_->state, player, quest));
}

GameResult<std::vector<QuestStanding>> InMemoryProgressionStore::questStandings(QuestId quest) {
    std::shared_lock lock(impl_->stateMutex);
    return ok(readStandings(impl_->state, quest));
}

GameResult<bool> InMemoryProgressionStore::hasEvent(std::string_view identity) {
    std::shared_lock lock(impl_->stateMutex);
    return ok(impl_->log.identities.count(std::string(identity)) != 0);
}

GameResult<std::vector<EventLogEntry>> InMemoryProgressionStore::recentEvents(std::size_t limit) {
    std::shared_lock lock(impl_->stateMutex);
    return ok(readRecent(impl_->log, nullptr, limit));
}

} // namespace fxp::progression

/// @file sql_progression_store.cpp
/// @brief SqlProgressionStore implementation.

#include "fxp/progression/sql_progression_store.hpp"

#include <array>
#include <functional>
#include <string>
#include <utility>

#include "fxp/foundation/game_logger.hpp"
#include "fxp/foundation/time_utils.hpp"

namespace fxp::progression {

using foundation::dbInt;
using foundation::dbTimestamp;
using foundation::dbText;
using foundation::DbRow;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::LogCategory;
using foundation::PreparedStatement;
using foundation::QueryResult;

namespace {

using QueryFn = std::function<GameResult<QueryResult>(std::string_view)>;

constexpr std::array<std::string_view, 6> kSchema = {
    "CREATE TABLE IF NOT EXISTS players("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " display_name TEXT NOT NULL UNIQUE,"
    " eligible INTEGER NOT NULL DEFAULT 0,"
    " last_seen TEXT NOT NULL)",

    "CREATE TABLE IF NOT EXISTS stats("
    " player_id INTEGER PRIMARY KEY REFERENCES players(id),"
    " kills INTEGER NOT NULL DEFAULT 0,"
    " deaths INTEGER NOT NULL DEFAULT 0,"
    " extracts INTEGER NOT NULL DEFAULT 0,"
    " survivals INTEGER NOT NULL DEFAULT 0,"
    " dogtags INTEGER NOT NULL DEFAULT 0,"
    " xp INTEGER NOT NULL DEFAULT 0,"
    " level INTEGER NOT NULL DEFAULT 1)",

    "CREATE TABLE IF NOT EXISTS events("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " identity TEXT NOT NULL UNIQUE,"
    " ts TEXT NOT NULL,"
    " type TEXT NOT NULL,"
    " actor TEXT NOT NULL,"
    " data TEXT NOT NULL)",

    "CREATE TABLE IF NOT EXISTS quests("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " quest_key TEXT NOT NULL UNIQUE,"
    " title TEXT NOT NULL,"
    " event_type TEXT NOT NULL,"
    " target INTEGER NOT NULL,"
    " start_ts TEXT NOT NULL,"
    " end_ts TEXT NOT NULL,"
    " active INTEGER NOT NULL DEFAULT 1)",

    "CREATE TABLE IF NOT EXISTS quest_progress("
    " player_id INTEGER NOT NULL REFERENCES players(id),"
    " quest_id INTEGER NOT NULL REFERENCES quests(id),"
    " progress INTEGER NOT NULL DEFAULT 0,"
    " completed_ts TEXT,"
    " PRIMARY KEY(player_id, quest_id))",

    "CREATE INDEX IF NOT EXISTS idx_quests_active ON quests(active, event_type)",
};

constexpr std::string_view kQuestColumns =
    "id, quest_key, title, event_type, target, start_ts, end_ts, active";

constexpr std::string_view kStatsColumns =
    "kills, deaths, extracts, survivals, dogtags, xp, level";

Timestamp readTs(const DbRow& row, const std::string& column) {
    return dbTimestamp(row, column).value_or(Timestamp{});
}

PlayerRecord playerFromRow(const DbRow& row) {
    PlayerRecord player;
    player.id = PlayerId(dbInt(row, "id"));
    player.displayName = dbText(row, "display_name");
    player.eligible = dbInt(row, "eligible") != 0;
    player.lastSeen = readTs(row, "last_seen");
    return player;
}

PlayerStats statsFromRow(const DbRow& row) {
    PlayerStats stats;
    stats.kills = dbInt(row, "kills");
    stats.deaths = dbInt(row, "deaths");
    stats.extracts = dbInt(row, "extracts");
    stats.survivals = dbInt(row, "survivals");
    stats.dogtags = dbInt(row, "dogtags");
    stats.xp = dbInt(row, "xp");
    stats.level = dbInt(row, "level");
    return stats;
}

Quest questFromRow(const DbRow& row) {
    Quest quest;
    quest.id = QuestId(dbInt(row, "id"));
    quest.key = dbText(row, "quest_key");
    quest.title = dbText(row, "title");
    quest.eventType = dbText(row, "event_type");
    quest.target = dbInt(row, "target");
    quest.start = readTs(row, "start_ts");
    quest.end = readTs(row, "end_ts");
    quest.active = dbInt(row, "active") != 0;
    return quest;
}

QuestProgress progressFromRow(const DbRow& row) {
    QuestProgress progress;
    progress.playerId = PlayerId(dbInt(row, "player_id"));
    progress.questId = QuestId(dbInt(row, "quest_id"));
    progress.progress = dbInt(row, "progress");
    progress.completedAt = dbTimestamp(row, "completed_ts");
    return progress;
}

EventLogEntry eventFromRow(const DbRow& row) {
    EventLogEntry entry;
    entry.id = EventId(dbInt(row, "id"));
    entry.identity = dbText(row, "identity");
    entry.event.timestamp = readTs(row, "ts");
    entry.event.type = dbText(row, "type");
    entry.event.actor = dbText(row, "actor");
    entry.event.attributes = ingest::attributesFromJson(dbText(row, "data"));
    return entry;
}

// Run a SELECT and map each row.
template <typename T, typename Map>
GameResult<std::vector<T>> selectAll(const QueryFn& query, const PreparedStatement& stmt,
                                     Map map) {
    auto rows = query(stmt.resolve());
    if (!rows) {
        return GameResult<std::vector<T>>::err(rows.error());
    }
    std::vector<T> out;
    out.reserve(rows.value().size());
    for (const auto& row : rows.value()) {
        out.push_back(map(row));
    }
    return GameResult<std::vector<T>>::ok(std::move(out));
}

// Run a SELECT expected to return at most one row.
template <typename T, typename Map>
GameResult<std::optional<T>> selectOne(const QueryFn& query, const PreparedStatement& stmt,
                                       Map map) {
    auto rows = query(stmt.resolve());
    if (!rows) {
        return GameResult<std::optional<T>>::err(rows.error());
    }
    if (rows.value().empty()) {
        return GameResult<std::optional<T>>::ok(std::nullopt);
    }
    return GameResult<std::optional<T>>::ok(map(rows.value().front()));
}

// ----- shared reads ----------------------------------------------------------

GameResult<std::optional<PlayerRecord>> sqlFindPlayer(const QueryFn& q, std::string_view name) {
    PreparedStatement stmt(
        "SELECT id, display_name, eligible, last_seen FROM players WHERE display_name = $name");
    stmt.bindString("name", std::string(name));
    return selectOne<PlayerRecord>(q, stmt, playerFromRow);
}

GameResult<std::optional<PlayerRecord>> sqlFindPlayerById(const QueryFn& q, PlayerId id) {
    PreparedStatement stmt(
        "SELECT id, display_name, eligible, last_seen FROM players WHERE id = $id");
    stmt.bindInt("id", id.value());
    return selectOne<PlayerRecord>(q, stmt, playerFromRow);
}

GameResult<std::optional<PlayerStats>> sqlFindStats(const QueryFn& q, PlayerId player) {
    PreparedStatement stmt("SELECT " + std::string(kStatsColumns) +
                           " FROM stats WHERE player_id = $player");
    stmt.bindInt("player", player.value());
    return selectOne<PlayerStats>(q, stmt, statsFromRow);
}

GameResult<std::vector<PlayerCard>> sqlTopPlayers(const QueryFn& q, std::size_t limit) {
    PreparedStatement stmt(
        "SELECT p.id AS id, p.display_name AS display_name, p.eligible AS eligible,"
        " p.last_seen AS last_seen, s.kills AS kills, s.deaths AS deaths,"
        " s.extracts AS extracts, s.survivals AS survivals, s.dogtags AS dogtags,"
        " s.xp AS xp, s.level AS level"
        " FROM stats s JOIN players p ON p.id = s.player_id"
        " ORDER BY s.xp DESC, p.display_name ASC LIMIT $limit");
    stmt.bindInt("limit", static_cast<std::int64_t>(limit));
    return selectAll<PlayerCard>(q, stmt, [](const DbRow& row) {
        return PlayerCard{playerFromRow(row), statsFromRow(row)};
    });
}

GameResult<std::optional<Quest>> sqlFindQuest(const QueryFn& q, std::string_view key) {
    PreparedStatement stmt("SELECT " + std::string(kQuestColumns) +
                           " FROM quests WHERE quest_key = $key");
    stmt.bindString("key", std::string(key));
    return selectOne<Quest>(q, stmt, questFromRow);
}

GameResult<std::optional<Quest>> sqlFindQuestById(const QueryFn& q, QuestId id) {
    PreparedStatement stmt("SELECT " + std::string(kQuestColumns) +
                           " FROM quests WHERE id = $id");
    stmt.bindInt("id", id.value());
    return selectOne<Quest>(q, stmt, questFromRow);
}

GameResult<std::vector<Quest>> sqlListQuests(const QueryFn& q, bool activeOnly) {
    PreparedStatement stmt("SELECT " + std::string(kQuestColumns) + " FROM quests" +
                           (activeOnly ? " WHERE active = 1" : "") + " ORDER BY id");
    return selectAll<Quest>(q, stmt, questFromRow);
}

GameResult<std::optional<QuestProgress>> sqlFindProgress(const QueryFn& q, PlayerId player,
                                                         QuestId quest) {
    PreparedStatement stmt(
        "SELECT player_id, quest_id, progress, completed_ts FROM quest_progress"
        " WHERE player_id = $player AND quest_id = $quest");
    stmt.bindInt("player", player.value()).bindInt("quest", quest.value());
    return selectOne<QuestProgress>(q, stmt, progressFromRow);
}

GameResult<std::vector<QuestStanding>> sqlQuestStandings(const QueryFn& q, QuestId quest) {
    PreparedStatement stmt(
        "SELECT qp.player_id AS player_id, p.display_name AS display_name,"
        " qp.progress AS progress, qp.completed_ts AS completed_ts"
        " FROM quest_progress qp JOIN players p ON p.id = qp.player_id"
        " WHERE qp.quest_id = $quest"
        " ORDER BY qp.progress DESC, p.display_name ASC");
    stmt.bindInt("quest", quest.value());
    return selectAll<QuestStanding>(q, stmt, [](const DbRow& row) {
        return QuestStanding{PlayerId(dbInt(row, "player_id")), dbText(row, "display_name"),
                             dbInt(row, "progress"), dbTimestamp(row, "completed_ts")};
    });
}

GameResult<bool> sqlHasEvent(const QueryFn& q, std::string_view identity) {
    PreparedStatement stmt("SELECT id FROM events WHERE identity = $identity");
    stmt.bindString("identity", std::string(identity));
    auto rows = q(stmt.resolve());
    if (!rows) {
        return GameResult<bool>::err(rows.error());
    }
    return GameResult<bool>::ok(!rows.value().empty());
}

GameResult<std::vector<EventLogEntry>> sqlRecentEvents(const QueryFn& q, std::size_t limit) {
    PreparedStatement stmt(
        "SELECT id, identity, ts, type, actor, data FROM events ORDER BY id DESC LIMIT $limit");
    stmt.bindInt("limit", static_cast<std::int64_t>(limit));
    return selectAll<EventLogEntry>(q, stmt, eventFromRow);
}

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------

class SqlTransaction final : public IProgressionTransaction {
public:
    explicit SqlTransaction(foundation::Transaction txn)
        : txn_(std::move(txn)),
          query_([this](std::string_view sql) { return txn_.query(sql); }) {}

    ~SqlTransaction() override { rollback(); }

    // --- reads ---

    GameResult<std::optional<PlayerRecord>> findPlayer(std::string_view name) override {
        return sqlFindPlayer(query_, name);
    }

    GameResult<std::optional<PlayerStats>> findStats(PlayerId player) override {
        return sqlFindStats(query_, player);
    }

    GameResult<std::vector<PlayerCard>> topPlayers(std::size_t limit) override {
        return sqlTopPlayers(query_, limit);
    }

    GameResult<std::optional<Quest>> findQuest(std::string_view key) override {
        return sqlFindQuest(query_, key);
    }

    GameResult<std::vector<Quest>> listQuests(bool activeOnly) override {
        return sqlListQuests(query_, activeOnly);
    }

    GameResult<std::optional<QuestProgress>> findProgress(PlayerId player, QuestId quest) override {
        return sqlFindProgress(query_, player, quest);
    }

    GameResult<std::vector<QuestStanding>> questStandings(QuestId quest) override {
        return sqlQuestStandings(query_, quest);
    }

    GameResult<bool> hasEvent(std::string_view identity) override {
        return sqlHasEvent(query_, identity);
    }

    GameResult<std::vector<EventLogEntry>> recentEvents(std::size_t limit) override {
        return sqlRecentEvents(query_, limit);
    }

    // --- writes ---

    GameResult<PlayerRecord> upsertPlayer(std::string_view name, Timestamp seen) override {
        PreparedStatement stmt(
            "INSERT INTO players(display_name, eligible, last_seen) VALUES($name, 0, $seen)"
            " ON CONFLICT(display_name) DO UPDATE SET last_seen = excluded.last_seen");
        stmt.bindString("name", std::string(name))
            .bindTimestamp("seen", seen);
        if (auto done = txn_.execute(stmt.resolve()); !done) {
            return GameResult<PlayerRecord>::err(done.error());
        }
        auto player = sqlFindPlayer(query_, name);
        if (!player) {
            return GameResult<PlayerRecord>::err(player.error());
        }
        if (!player.value()) {
            return GameResult<PlayerRecord>::err(GameError(
                ErrorCode::StoreUnavailable, "player row missing after upsert: " + std::string(name)));
        }
        return GameResult<PlayerRecord>::ok(std::move(*player.value()));
    }

    GameResult<PlayerStats> ensureStats(PlayerId player) override {
        if (auto exists = requirePlayer(player); !exists) {
            return GameResult<PlayerStats>::err(exists.error());
        }
        PreparedStatement stmt(
            "INSERT INTO stats(player_id) VALUES($player) ON CONFLICT(player_id) DO NOTHING");
        stmt.bindInt("player", player.value());
        if (auto done = txn_.execute(stmt.resolve()); !done) {
            return GameResult<PlayerStats>::err(done.error());
        }
        auto stats = sqlFindStats(query_, player);
        if (!stats) {
            return GameResult<PlayerStats>::err(stats.error());
        }
        return GameResult<PlayerStats>::ok(stats.value().value_or(PlayerStats{}));
    }

    GameResult<void> saveStats(PlayerId player, const PlayerStats& stats) override {
        if (auto exists = requirePlayer(player); !exists) {
            return exists;
        }
        PreparedStatement stmt(
            "UPDATE stats SET kills = $kills, deaths = $deaths, extracts = $extracts,"
            " survivals = $survivals, dogtags = $dogtags, xp = $xp, level = $level"
            " WHERE player_id = $player");
        stmt.bindInt("kills", stats.kills)
            .bindInt("deaths", stats.deaths)
            .bindInt("extracts", stats.extracts)
            .bindInt("survivals", stats.survivals)
            .bindInt("dogtags", stats.dogtags)
            .bindInt("xp", stats.xp)
            .bindInt("level", stats.level)
            .bindInt("player", player.value());
        return txn_.execute(stmt.resolve());
    }

    GameResult<void> setEligible(PlayerId player, bool eligible) override {
        if (auto exists = requirePlayer(player); !exists) {
            return exists;
        }
        PreparedStatement stmt("UPDATE players SET eligible = $eligible WHERE id = $id");
        stmt.bindBool("eligible", eligible).bindInt("id", player.value());
        return txn_.execute(stmt.resolve());
    }

    GameResult<EventId> appendEvent(const ingest::Event& event,
                                    std::string_view identity) override {
        PreparedStatement insert(
            "INSERT INTO events(identity, ts, type, actor, data)"
            " VALUES($identity, $ts, $type, $actor, $data)");
        insert.bindString("identity", std::string(identity))
            .bindTimestamp("ts", event.timestamp)
            .bindString("type", event.type)
            .bindString("actor", event.actor)
            .bindString("data", ingest::attributesToJson(event.attributes));
        if (auto done = txn_.execute(insert.resolve()); !done) {
            return GameResult<EventId>::err(done.error());
        }

        PreparedStatement select("SELECT id FROM events WHERE identity = $identity");
        select.bindString("identity", std::string(identity));
        auto rows = txn_.query(select.resolve());
        if (!rows) {
            return GameResult<EventId>::err(rows.error());
        }
        if (rows.value().empty()) {
            return GameResult<EventId>::err(
                GameError(ErrorCode::StoreUnavailable, "event row missing after insert"));
        }
        return GameResult<EventId>::ok(EventId(dbInt(rows.value().front(), "id")));
    }

    GameResult<Quest> createQuest(const Quest& quest) override {
        auto existing = sqlFindQuest(query_, quest.key);
        if (!existing) {
            return GameResult<Quest>::err(existing.error());
        }
        if (existing.value()) {
            return GameResult<Quest>::err(
                GameError(ErrorCode::AlreadyExists, "quest key already exists: " + quest.key));
        }

        PreparedStatement stmt(
            "INSERT INTO quests(quest_key, title, event_type, target, start_ts, end_ts, active)"
            " VALUES($key, $title, $event_type, $target, $start, $end, $active)");
        stmt.bindString("key", quest.key)
            .bindString("title", quest.title)
            .bindString("event_type", quest.eventType)
            .bindInt("target", quest.target)
            .bindTimestamp("start", quest.start)
            .bindTimestamp("end", quest.end)
            .bindBool("active", quest.active);
        if (auto done = txn_.execute(stmt.resolve()); !done) {
            return GameResult<Quest>::err(done.error());
        }

        auto created = sqlFindQuest(query_, quest.key);
        if (!created) {
            return GameResult<Quest>::err(created.error());
        }
        if (!created.value()) {
            return GameResult<Quest>::err(
                GameError(ErrorCode::StoreUnavailable, "quest row missing after insert"));
        }
        return GameResult<Quest>::ok(std::move(*created.value()));
    }

    GameResult<bool> insertQuestIfAbsent(const Quest& quest) override {
        auto existing = sqlFindQuest(query_, quest.key);
        if (!existing) {
            return GameResult<bool>::err(existing.error());
        }
        if (existing.value()) {
            return GameResult<bool>::ok(false);
        }
        auto created = createQuest(quest);
        if (!created) {
            return GameResult<bool>::err(created.error());
        }
        return GameResult<bool>::ok(true);
    }

    GameResult<void> updateQuest(const Quest& quest) override {
        if (auto exists = requireQuest(quest.id); !exists) {
            return exists;
        }
        PreparedStatement stmt(
            "UPDATE quests SET title = $title, event_type = $event_type, target = $target,"
            " start_ts = $start, end_ts = $end, active = $active WHERE id = $id");
        stmt.bindString("title", quest.title)
            .bindString("event_type", quest.eventType)
            .bindInt("target", quest.target)
            .bindTimestamp("start", quest.start)
            .bindTimestamp("end", quest.end)
            .bindBool("active", quest.active)
            .bindInt("id", quest.id.value());
        return txn_.execute(stmt.resolve());
    }

    GameResult<void> deleteQuest(QuestId quest) override {
        if (auto exists = requireQuest(quest); !exists) {
            return exists;
        }
        PreparedStatement progress("DELETE FROM quest_progress WHERE quest_id = $quest");
        progress.bindInt("quest", quest.value());
        if (auto done = txn_.execute(progress.resolve()); !done) {
            return done;
        }
        PreparedStatement row("DELETE FROM quests WHERE id = $quest");
        row.bindInt("quest", quest.value());
        return txn_.execute(row.resolve());
    }

    GameResult<std::size_t> deactivateExpired(Timestamp now) override {
        auto nowText = foundation::formatIso8601(now);

        PreparedStatement count(
            "SELECT COUNT(*) AS n FROM quests WHERE active = 1 AND end_ts <= $now");
        count.bindString("now", nowText);
        auto rows = txn_.query(count.resolve());
        if (!rows) {
            return GameResult<std::size_t>::err(rows.error());
        }
        auto expired = rows.value().empty() ? 0 : dbInt(rows.value().front(), "n");
        if (expired == 0) {
            return GameResult<std::size_t>::ok(std::size_t{0});
        }

        PreparedStatement update("UPDATE quests SET active = 0 WHERE active = 1 AND end_ts <= $now");
        update.bindString("now", nowText);
        if (auto done = txn_.execute(update.resolve()); !done) {
            return GameResult<std::size_t>::err(done.error());
        }
        return GameResult<std::size_t>::ok(static_cast<std::size_t>(expired));
    }

    GameResult<QuestProgress> ensureProgress(PlayerId player, QuestId quest) override {
        if (auto exists = requirePlayer(player); !exists) {
            return GameResult<QuestProgress>::err(exists.error());
        }
        if (auto exists = requireQuest(quest); !exists) {
            return GameResult<QuestProgress>::err(exists.error());
        }
        PreparedStatement stmt(
            "INSERT INTO quest_progress(player_id, quest_id, progress) VALUES($player, $quest, 0)"
            " ON CONFLICT(player_id, quest_id) DO NOTHING");
        stmt.bindInt("player", player.value()).bindInt("quest", quest.value());
        if (auto done = txn_.execute(stmt.resolve()); !done) {
            return GameResult<QuestProgress>::err(done.error());
        }
        auto row = sqlFindProgress(query_, player, quest);
        if (!row) {
            return GameResult<QuestProgress>::err(row.error());
        }
        return GameResult<QuestProgress>::ok(
            row.value().value_or(QuestProgress{player, quest, 0, std::nullopt}));
    }

    GameResult<void> saveProgress(const QuestProgress& progress) override {
        PreparedStatement stmt(
            "UPDATE quest_progress SET progress = $progress, completed_ts = $completed"
            " WHERE player_id = $player AND quest_id = $quest");
        stmt.bindInt("progress", progress.progress)
            .bindInt("player", progress.playerId.value())
            .bindInt("quest", progress.questId.value());
        if (progress.completedAt) {
            stmt.bindTimestamp("completed", *progress.completedAt);
        } else {
            stmt.bindNull("completed");
        }
        return txn_.execute(stmt.resolve());
    }

    GameResult<void> commit() override {
        return txn_.commit();
    }

    void rollback() override {
        if (!txn_.isActive()) {
            return;
        }
        if (auto undone = txn_.rollback(); !undone) {
            FXP_LOG_WARN(LogCategory::Database,
                         "rollback failed: " + undone.error().describe());
        }
    }

private:
    GameResult<void> requirePlayer(PlayerId player) {
        auto found = sqlFindPlayerById(query_, player);
        if (!found) {
            return GameResult<void>::err(found.error());
        }
        if (!found.value()) {
            return GameResult<void>::err(GameError(
                ErrorCode::PlayerNotFound, "player " + std::to_string(player.value()) + " not found"));
        }
        return GameResult<void>::ok();
    }

    GameResult<void> requireQuest(QuestId quest) {
        auto found = sqlFindQuestById(query_, quest);
        if (!found) {
            return GameResult<void>::err(found.error());
        }
        if (!found.value()) {
            return GameResult<void>::err(GameError(
                ErrorCode::QuestNotFound, "quest " + std::to_string(quest.value()) + " not found"));
        }
        return GameResult<void>::ok();
    }

    foundation::Transaction txn_;
    QueryFn query_;
};

} // namespace

// ---------------------------------------------------------------------------
// SqlProgressionStore
// ---------------------------------------------------------------------------

struct SqlProgressionStore::Impl {
    foundation::GameDatabase db;
    QueryFn query = [this](std::string_view sql) { return db.query(sql); };
};

SqlProgressionStore::SqlProgressionStore()
    : impl_(std::make_unique<Impl>()) {}

SqlProgressionStore::~SqlProgressionStore() = default;

GameResult<void> SqlProgressionStore::open(const foundation::DatabaseConfig& config) {
    if (auto connected = impl_->db.connect(config); !connected) {
        FXP_LOG_ERROR(LogCategory::Database,
                      "cannot open store " + config.connectionString + ": " +
                      connected.error().describe());
        return connected;
    }

    for (auto ddl : kSchema) {
        if (auto created = impl_->db.execute(ddl); !created) {
            FXP_LOG_ERROR(LogCategory::Database,
                          "schema creation failed: " + created.error().describe());
            impl_->db.disconnect();
            return created;
        }
    }

    FXP_LOG_INFO(LogCategory::Database, "progression store ready at " + config.connectionString);
    return GameResult<void>::ok();
}

void SqlProgressionStore::close() {
    impl_->db.disconnect();
}

bool SqlProgressionStore::isOpen() const noexcept {
    return impl_->db.isConnected();
}

GameResult<std::unique_ptr<IProgressionTransaction>> SqlProgressionStore::beginTransaction() {
    using Txn = GameResult<std::unique_ptr<IProgressionTransaction>>;

    if (!impl_->db.isConnected()) {
        return Txn::err(GameError(ErrorCode::StoreUnavailable, "progression store is not open"));
    }
    auto txn = impl_->db.beginTransaction();
    if (!txn) {
        return Txn::err(GameError(ErrorCode::StoreUnavailable,
                                  "cannot begin transaction: " +
                                  txn.error().describe()));
    }
    return Txn::ok(std::make_unique<SqlTransaction>(std::move(txn).value()));
}

GameResult<std::optional<PlayerRecord>> SqlProgressionStore::findPlayer(
    std::string_view displayName) {
    return sqlFindPlayer(impl_->query, displayName);
}

GameResult<std::optional<PlayerStats>> SqlProgressionStore::findStats(PlayerId player) {
    return sqlFindStats(impl_->query, player);
}

GameResult<std::vector<PlayerCard>> SqlProgressionStore::topPlayers(std::size_t limit) {
    return sqlTopPlayers(impl_->query, limit);
}

GameResult<std::optional<Quest>> SqlProgressionStore::findQuest(std::string_view key) {
    return sqlFindQuest(impl_->query, key);
}

GameResult<std::vector<Quest>> SqlProgressionStore::listQuests(bool activeOnly) {
    return sqlListQuests(impl_->query, activeOnly);
}

GameResult<std::optional<QuestProgress>> SqlProgressionStore::findProgress(PlayerId player,
                                                                           QuestId quest) {
    return sqlFindProgress(impl_->query, player, quest);
}

GameResult<std::vector<QuestStanding>> SqlProgressionStore::questStandings(QuestId quest) {
    return sqlQuestStandings(impl_->query, quest);
}

GameResult<bool> SqlProgressionStore::hasEvent(std::string_view identity) {
    return sqlHasEvent(impl_->query, identity);
}

GameResult<std::vector<EventLogEntry>> SqlProgressionStore::recentEvents(std::size_t limit) {
    return sqlRecentEvents(impl_->query, limit);
}

} // namespace fxp::progression

#pragma once

/// @file game_database.hpp
/// @brief SQLite access through kcenon database_system: leased connections,
///        placeholder binding and RAII transactions.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "fxp/foundation/game_result.hpp"
#include "fxp/foundation/types.hpp"

namespace fxp::foundation {

/// Sentinel type representing SQL NULL.
struct DbNull {};

/// A single column value. The progression schema only stores integers and
/// text; REAL columns read as truncated integers.
using DbValue = std::variant<DbNull, std::string, std::int64_t, bool>;

/// A single row: column name -> value.
using DbRow = std::unordered_map<std::string, DbValue>;

/// Complete result set from a SELECT query.
using QueryResult = std::vector<DbRow>;

/// Database file and connection settings (`store.*`).
///
/// One connection by default: SQLite allows a single writer, so a second
/// transaction (e.g. quest rotation during ingestion) waits for the lease
/// instead of failing with SQLITE_BUSY.
struct DatabaseConfig {
    std::string connectionString;
    std::uint32_t maxConnections = 1;
    /// How long a caller waits for a free connection.
    std::chrono::seconds connectionTimeout{30};
    /// SQLite busy_timeout for locks held by other processes (readers such
    /// as a bot serving the leaderboard).
    std::chrono::milliseconds busyTimeout{5000};
};

[[nodiscard]] std::int64_t dbInt(const DbRow& row, const std::string& column);

/// NULL and missing columns read as "".
[[nodiscard]] std::string dbText(const DbRow& row, const std::string& column);

/// True when the column is absent or SQL NULL.
[[nodiscard]] bool dbIsNull(const DbRow& row, const std::string& column);

/// ISO-8601 text column as a timestamp; nullopt for NULL or unparsable text.
[[nodiscard]] std::optional<Timestamp> dbTimestamp(const DbRow& row, const std::string& column);

/// A SQL template with `$name` placeholders.
///
/// A placeholder is `$` followed by letters, digits and underscores; the
/// whole name must be bound, so `$id` never matches inside `$id_other`.
/// Unbound placeholders are left as written.
///
/// @code
///   PreparedStatement stmt("SELECT id FROM players WHERE display_name = $name");
///   stmt.bindString("name", "O'Brien");
///   auto rows = txn.query(stmt.resolve());
/// @endcode
class PreparedStatement {
public:
    explicit PreparedStatement(std::string sql);

    PreparedStatement& bindString(std::string_view name, std::string value);
    PreparedStatement& bindInt(std::string_view name, std::int64_t value);
    PreparedStatement& bindBool(std::string_view name, bool value);
    /// Bound as ISO-8601 UTC text, so lexical order is time order.
    PreparedStatement& bindTimestamp(std::string_view name, Timestamp value);
    PreparedStatement& bindNull(std::string_view name);

    [[nodiscard]] std::string_view sql() const noexcept { return sql_; }

    /// The template with every bound placeholder substituted. Text is
    /// single-quoted with embedded quotes doubled; booleans render as 1/0.
    [[nodiscard]] std::string resolve() const;

    void clearBindings() { params_.clear(); }

private:
    std::string sql_;
    std::unordered_map<std::string, DbValue> params_;
};

/// RAII transaction on one leased connection.
///
/// Rolls back on destruction unless commit() or rollback() was called; the
/// connection goes back to the pool when the transaction ends.
class Transaction {
public:
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) noexcept;
    Transaction& operator=(Transaction&&) noexcept;

    [[nodiscard]] GameResult<void> commit();
    [[nodiscard]] GameResult<void> rollback();

    [[nodiscard]] GameResult<QueryResult> query(std::string_view sql);

    /// Execute a command (INSERT/UPDATE/DELETE/DDL).
    [[nodiscard]] GameResult<void> execute(std::string_view sql);

    [[nodiscard]] bool isActive() const noexcept;

private:
    friend class GameDatabase;
    struct Impl;
    explicit Transaction(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

/// SQLite database over kcenon's database_system.
///
/// Statements outside a transaction borrow a connection for their own
/// duration; beginTransaction() keeps one until the transaction ends.
///
/// @code
///   GameDatabase db;
///   DatabaseConfig config;
///   config.connectionString = "/var/lib/fika_xp/fika.db";
///   if (db.connect(config)) {
///       auto rows = db.query("SELECT COUNT(*) AS n FROM players");
///   }
/// @endcode
class GameDatabase {
public:
    GameDatabase();
    ~GameDatabase();

    GameDatabase(const GameDatabase&) = delete;
    GameDatabase& operator=(const GameDatabase&) = delete;

    /// Open the first connection (creating the database file) so a bad
    /// path fails here rather than on the first event.
    [[nodiscard]] GameResult<void> connect(const DatabaseConfig& config);

    void disconnect();

    [[nodiscard]] bool isConnected() const noexcept;

    [[nodiscard]] GameResult<QueryResult> query(std::string_view sql);

    [[nodiscard]] GameResult<void> execute(std::string_view sql);

    [[nodiscard]] GameResult<Transaction> beginTransaction();

    /// Connections currently leased to statements or transactions.
    [[nodiscard]] std::size_t leasedConnections() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fxp::foundation

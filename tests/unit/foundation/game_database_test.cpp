#include <gtest/gtest.h>

#include <string>

#include "fxp/foundation/game_database.hpp"
#include "fxp/foundation/time_utils.hpp"

using namespace fxp::foundation;

// ---------------------------------------------------------------------------
// PreparedStatement
// ---------------------------------------------------------------------------

TEST(PreparedStatementTest, BindsEveryValueKind) {
    PreparedStatement stmt(
        "INSERT INTO t VALUES ($name, $count, $flag, $missing)");
    stmt.bindString("name", "PlayerA")
        .bindInt("count", 42)
        .bindBool("flag", true)
        .bindNull("missing");

    EXPECT_EQ(stmt.resolve(), "INSERT INTO t VALUES ('PlayerA', 42, 1, NULL)");
}

TEST(PreparedStatementTest, BindsTimestampAsIsoText) {
    auto ts = makeUtc(2024, 1, 4, 12, 30, 5);
    ASSERT_TRUE(ts.has_value());

    PreparedStatement stmt("SELECT * FROM events WHERE ts >= $since");
    stmt.bindTimestamp("since", *ts);
    EXPECT_EQ(stmt.resolve(), "SELECT * FROM events WHERE ts >= '2024-01-04T12:30:05Z'");
}

TEST(PreparedStatementTest, LeavesUnboundPlaceholders) {
    PreparedStatement stmt("UPDATE t SET a = $a WHERE b = $b");
    stmt.bindInt("a", 5);
    EXPECT_EQ(stmt.resolve(), "UPDATE t SET a = 5 WHERE b = $b");
}

TEST(PreparedStatementTest, EscapesSingleQuotes) {
    PreparedStatement stmt("SELECT id FROM players WHERE display_name = $name");
    stmt.bindString("name", "O'Brien");
    EXPECT_EQ(stmt.resolve(), "SELECT id FROM players WHERE display_name = 'O''Brien'");
}

TEST(PreparedStatementTest, DoesNotReplaceLongerPlaceholderNames) {
    PreparedStatement stmt("SELECT $id, $id_other");
    stmt.bindInt("id", 1).bindInt("id_other", 2);
    EXPECT_EQ(stmt.resolve(), "SELECT 1, 2");
}

TEST(PreparedStatementTest, RepeatedPlaceholderAndClear) {
    PreparedStatement stmt("SELECT $v + $v");
    stmt.bindInt("v", 3);
    EXPECT_EQ(stmt.resolve(), "SELECT 3 + 3");

    stmt.clearBindings();
    EXPECT_EQ(stmt.resolve(), "SELECT $v + $v");
    EXPECT_EQ(stmt.sql(), "SELECT $v + $v");
}

// ---------------------------------------------------------------------------
// Row accessors
// ---------------------------------------------------------------------------

TEST(DbRowTest, IntAccessorCoercesColumnTypes) {
    DbRow row{{"i", std::int64_t{7}},
              {"b", true},
              {"s", std::string("15")},
              {"n", DbNull{}}};
    EXPECT_EQ(dbInt(row, "i"), 7);
    EXPECT_EQ(dbInt(row, "b"), 1);
    EXPECT_EQ(dbInt(row, "s"), 15);
    EXPECT_EQ(dbInt(row, "n"), 0);
    EXPECT_EQ(dbInt(row, "absent"), 0);
}

TEST(DbRowTest, TextAndNullAccessors) {
    DbRow row{{"s", std::string("KILL")}, {"n", DbNull{}}};
    EXPECT_EQ(dbText(row, "s"), "KILL");
    EXPECT_EQ(dbText(row, "n"), "");
    EXPECT_TRUE(dbIsNull(row, "n"));
    EXPECT_TRUE(dbIsNull(row, "absent"));
    EXPECT_FALSE(dbIsNull(row, "s"));
}

TEST(DbRowTest, TimestampAccessor) {
    DbRow row{{"ts", std::string("2024-01-04T00:00:00Z")},
              {"bad", std::string("yesterday")},
              {"n", DbNull{}}};
    EXPECT_EQ(dbTimestamp(row, "ts"), makeUtc(2024, 1, 4, 0, 0, 0));
    EXPECT_FALSE(dbTimestamp(row, "bad").has_value());
    EXPECT_FALSE(dbTimestamp(row, "n").has_value());
    EXPECT_FALSE(dbTimestamp(row, "absent").has_value());
}

// ---------------------------------------------------------------------------
// GameDatabase without a connection
// ---------------------------------------------------------------------------

TEST(GameDatabaseTest, OperationsFailWhenNotConnected) {
    GameDatabase db;
    EXPECT_FALSE(db.isConnected());
    EXPECT_EQ(db.leasedConnections(), 0u);

    auto rows = db.query("SELECT 1");
    ASSERT_FALSE(rows);
    EXPECT_EQ(rows.error().code(), ErrorCode::NotConnected);

    auto exec = db.execute(std::string_view("DELETE FROM players"));
    ASSERT_FALSE(exec);
    EXPECT_EQ(exec.error().code(), ErrorCode::NotConnected);

    auto txn = db.beginTransaction();
    ASSERT_FALSE(txn);
    EXPECT_EQ(txn.error().code(), ErrorCode::NotConnected);
}

TEST(GameDatabaseTest, DisconnectIsIdempotent) {
    GameDatabase db;
    db.disconnect();
    db.disconnect();
    EXPECT_FALSE(db.isConnected());
}

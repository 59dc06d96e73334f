#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"
#include "QueryBuilder.hpp"
#include "SQLiteConnection.hpp"
#include "Transaction.hpp"

using namespace sqlquery;
using namespace std::chrono_literals;
using ::testing::ElementsAre;

class SQLiteIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        conn_ = std::make_shared<SQLiteConnection>("test", ":memory:");
        conn_->executeScript(
            "CREATE TABLE users ("
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  name TEXT NOT NULL UNIQUE,"
            "  age INTEGER,"
            "  score REAL,"
            "  active INTEGER NOT NULL DEFAULT 1"
            ");"
            "INSERT INTO users (name, age, score, active) VALUES"
            "  ('alice', 30, 9.5, 1),"
            "  ('bob', 25, 7.0, 0),"
            "  ('carol', 41, 8.25, 1);");
    }

    std::shared_ptr<SQLiteConnection> conn_;
};

// Connection tests
TEST_F(SQLiteIntegrationTest, OpensInMemoryDatabase) {
    EXPECT_TRUE(conn_->isOpen());
    EXPECT_EQ(conn_->driver(), "sqlite");
    EXPECT_EQ(conn_->dialect(), Dialect::SQLite);
    EXPECT_NO_THROW(conn_->ping());
}

TEST_F(SQLiteIntegrationTest, ClosedConnectionRejectsStatements) {
    conn_->close();

    EXPECT_FALSE(conn_->isOpen());
    try {
        conn_->exec("SELECT 1");
        FAIL() << "expected DatabaseException";
    } catch (const DatabaseException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Connection);
    }
}

TEST_F(SQLiteIntegrationTest, OpenFailureThrows) {
    EXPECT_THROW(SQLiteConnection("bad", "/nonexistent-dir/sub/app.db"), SQLiteException);
}

// Read tests
TEST_F(SQLiteIntegrationTest, GetWithConditions) {
    Rows rows = conn_->table("users")
                    .select({"name", "age"})
                    .where("age", ">", 26)
                    .orderByDesc("age")
                    .get();

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].at("name"), Value("carol"));
    EXPECT_EQ(rows[0].at("age"), Value(41));
    EXPECT_EQ(rows[1].at("name"), Value("alice"));
}

TEST_F(SQLiteIntegrationTest, StorageClassesMapToValueTypes) {
    auto row = conn_->table("users").where("name", "=", "alice").first();

    ASSERT_TRUE(row.has_value());
    EXPECT_TRUE(row->at("id").isInt());
    EXPECT_TRUE(row->at("score").isDouble());
    EXPECT_TRUE(row->at("name").isString());
}

TEST_F(SQLiteIntegrationTest, NullRoundTrip) {
    conn_->table("users").insert({{"name", Value("dave")}, {"age", Value()}});

    auto row = conn_->table("users").whereNull("age").first();

    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->at("name"), Value("dave"));
    EXPECT_TRUE(row->at("age").isNull());
}

TEST_F(SQLiteIntegrationTest, BooleanBindsAsInteger) {
    EXPECT_EQ(conn_->table("users").where("active", "=", true).count(), 2);
}

TEST_F(SQLiteIntegrationTest, WhereInAndBetween) {
    auto names = conn_->table("users")
                     .whereIn("name", {Value("alice"), Value("carol"), Value("zed")})
                     .whereBetween("age", 20, 35)
                     .pluck("name");

    EXPECT_THAT(names, ElementsAre(Value("alice")));
}

TEST_F(SQLiteIntegrationTest, EmptyWhereInMatchesNothing) {
    EXPECT_TRUE(conn_->table("users").whereIn("id", {}).get().empty());
}

TEST_F(SQLiteIntegrationTest, PaginationWithForPage) {
    auto names = conn_->table("users").orderBy("id").forPage(2, 2).pluck("name");

    EXPECT_THAT(names, ElementsAre(Value("carol")));
}

TEST_F(SQLiteIntegrationTest, BlobReadsAsString) {
    conn_->executeScript("CREATE TABLE files (data BLOB)");
    conn_->executeScript("INSERT INTO files VALUES (X'6869006869')");

    Value data = conn_->table("files").value("data");

    ASSERT_TRUE(data.isString());
    EXPECT_EQ(data.asString(), std::string("hi\0hi", 5));
}

TEST_F(SQLiteIntegrationTest, RawQueryWithPlaceholders) {
    auto row = conn_->queryRow("SELECT name FROM users WHERE age = ?", {Value(25)});

    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->at("name"), Value("bob"));
}

// Aggregate tests
TEST_F(SQLiteIntegrationTest, Aggregates) {
    auto users = conn_->table("users");

    EXPECT_EQ(users.count(), 3);
    EXPECT_EQ(users.max("age"), Value(41));
    EXPECT_EQ(users.min("name"), Value("alice"));
    EXPECT_DOUBLE_EQ(users.sum("age"), 96.0);
    EXPECT_DOUBLE_EQ(users.avg("score"), (9.5 + 7.0 + 8.25) / 3);
}

TEST_F(SQLiteIntegrationTest, AggregatesOnEmptyTable) {
    conn_->table("users").remove();

    auto users = conn_->table("users");
    EXPECT_EQ(users.count(), 0);
    EXPECT_TRUE(users.max("age").isNull());
    EXPECT_DOUBLE_EQ(users.sum("age"), 0.0);
    EXPECT_TRUE(users.doesntExist());
}

// Write tests
TEST_F(SQLiteIntegrationTest, InsertGetIdReturnsRowId) {
    int64_t id = conn_->table("users").insertGetId({{"name", Value("erin")}, {"age", Value(22)}});

    EXPECT_EQ(id, 4);
    EXPECT_EQ(conn_->table("users").find(id)->at("name"), Value("erin"));
}

TEST_F(SQLiteIntegrationTest, InsertDefaultValues) {
    conn_->executeScript("CREATE TABLE events (id INTEGER PRIMARY KEY, kind TEXT DEFAULT 'ping')");

    EXPECT_EQ(conn_->table("events").insert({}), 1);
    EXPECT_EQ(conn_->table("events").value("kind"), Value("ping"));
}

TEST_F(SQLiteIntegrationTest, InsertBatch) {
    std::vector<ValueMap> records{{{"name", Value("f")}, {"age", Value(1)}},
                                  {{"name", Value("g")}, {"age", Value(2)}}};

    EXPECT_EQ(conn_->table("users").insertBatch(records), 2);
    EXPECT_EQ(conn_->table("users").count(), 5);
}

TEST_F(SQLiteIntegrationTest, UpdateAndIncrement) {
    EXPECT_EQ(conn_->table("users").where("active", "=", 1).update({{"score", Value(10.0)}}), 2);
    EXPECT_EQ(conn_->table("users").where("name", "=", "bob").increment("age", 5), 1);
    EXPECT_EQ(conn_->table("users").decrement("age"), 3);

    EXPECT_EQ(conn_->table("users").where("name", "=", "bob").value("age"), Value(29));
    EXPECT_EQ(conn_->table("users").where("name", "=", "alice").value("score"), Value(10.0));
}

TEST_F(SQLiteIntegrationTest, DeleteReturnsRowsAffected) {
    EXPECT_EQ(conn_->table("users").where("active", "=", 0).remove(), 1);
    EXPECT_EQ(conn_->table("users").count(), 2);
}

TEST_F(SQLiteIntegrationTest, TruncateDeletesAllRows) {
    conn_->table("users").truncate();

    EXPECT_EQ(conn_->table("users").count(), 0);
}

// Error tests
TEST_F(SQLiteIntegrationTest, UniqueViolationIsConstraint) {
    try {
        conn_->table("users").insert({{"name", Value("alice")}});
        FAIL() << "expected SQLiteException";
    } catch (const SQLiteException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Constraint);
        EXPECT_EQ(e.errorCode(), SQLITE_CONSTRAINT_UNIQUE);
    }
}

TEST_F(SQLiteIntegrationTest, MissingTableIsSyntaxError) {
    try {
        conn_->table("nope").get();
        FAIL() << "expected SQLiteException";
    } catch (const SQLiteException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Syntax);
        EXPECT_THAT(e.what(), ::testing::HasSubstr("no such table"));
    }
}

TEST_F(SQLiteIntegrationTest, RawExpressionCannotBeBound) {
    try {
        conn_->exec("SELECT ?", {Value(RawExpression{"1"})});
        FAIL() << "expected DatabaseException";
    } catch (const DatabaseException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Unsupported);
    }
}

TEST_F(SQLiteIntegrationTest, ForeignKeysEnforcedWhenEnabled) {
    auto conn = std::make_shared<SQLiteConnection>("fk", ":memory:", true);
    conn->executeScript(
        "CREATE TABLE parents (id INTEGER PRIMARY KEY);"
        "CREATE TABLE children (id INTEGER PRIMARY KEY,"
        "  parent_id INTEGER REFERENCES parents(id));");

    try {
        conn->table("children").insert({{"parent_id", Value(99)}});
        FAIL() << "expected SQLiteException";
    } catch (const SQLiteException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Constraint);
    }
}

TEST_F(SQLiteIntegrationTest, ForeignKeysOffByDefault) {
    conn_->executeScript(
        "CREATE TABLE parents (id INTEGER PRIMARY KEY);"
        "CREATE TABLE children (id INTEGER PRIMARY KEY,"
        "  parent_id INTEGER REFERENCES parents(id));");

    EXPECT_EQ(conn_->table("children").insert({{"parent_id", Value(99)}}), 1);
}

// Context tests
TEST_F(SQLiteIntegrationTest, CancelledContextStopsBeforeRunning) {
    QueryContext ctx;
    ctx.cancel();

    try {
        conn_->table("users").withContext(ctx).get();
        FAIL() << "expected DatabaseException";
    } catch (const DatabaseException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Cancelled);
    }
    EXPECT_EQ(conn_->table("users").count(), 3);
}

TEST_F(SQLiteIntegrationTest, DeadlineInterruptsRunningStatement) {
    auto ctx = QueryContext::withTimeout(50ms);

    try {
        conn_->queryContext(ctx,
                            "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) "
                            "SELECT COUNT(*) FROM c",
                            {})
            ->next();
        FAIL() << "expected DatabaseException";
    } catch (const DatabaseException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Timeout);
    }

    // The handler is removed once the step returns
    EXPECT_NO_THROW(conn_->ping());
}

// Transaction tests
TEST_F(SQLiteIntegrationTest, TransactionCommit) {
    conn_->transaction([](Transaction& tx) {
        tx.table("users").insert({{"name", Value("tx1")}});
        tx.table("users").where("name", "=", "bob").remove();
    });

    EXPECT_EQ(conn_->table("users").count(), 3);
    EXPECT_EQ(conn_->table("users").where("name", "=", "tx1").count(), 1);
}

TEST_F(SQLiteIntegrationTest, TransactionRollbackOnError) {
    EXPECT_THROW(conn_->transaction([](Transaction& tx) {
        tx.table("users").insert({{"name", Value("tx2")}});
        tx.table("users").insert({{"name", Value("alice")}});  // unique violation
    }), SQLiteException);

    EXPECT_EQ(conn_->table("users").where("name", "=", "tx2").count(), 0);
    EXPECT_FALSE(conn_->inTransaction());
}

TEST_F(SQLiteIntegrationTest, ExplicitRollback) {
    auto tx = conn_->beginTransaction();
    tx->table("users").update({{"age", Value(0)}});
    EXPECT_EQ(tx->table("users").where("age", "=", 0).count(), 3);
    tx->rollback();

    EXPECT_EQ(conn_->table("users").where("age", "=", 0).count(), 0);
}

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "DatabaseManager.hpp"
#include "ErrorHandler.hpp"
#include "Transaction.hpp"
#include <filesystem>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace sqlquery;
using ::testing::ElementsAre;

class DatabaseManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dbPath_ = std::filesystem::temp_directory_path() /
                  ("sqlquery_manager_" + std::to_string(::getpid()) + ".db");
        std::filesystem::remove(dbPath_);

        ConnectionConfig file;
        file.driver = "sqlite";
        file.database = dbPath_.string();

        ConnectionConfig memory;
        memory.driver = "sqlite3";
        memory.database = ":memory:";

        ConnectionConfig unknown;
        unknown.driver = "mssql";

        config_.default_connection = "main";
        config_.connections["main"] = file;
        config_.connections["scratch"] = memory;
        config_.connections["legacy"] = unknown;
    }

    void TearDown() override {
        std::filesystem::remove(dbPath_);
    }

    std::filesystem::path dbPath_;
    DatabaseConfig config_;
};

TEST_F(DatabaseManagerTest, ConnectionsOpenLazily) {
    DatabaseManager manager(config_);

    EXPECT_EQ(manager.openCount(), 0u);

    auto conn = manager.connection();
    EXPECT_EQ(manager.openCount(), 1u);
    EXPECT_EQ(conn->name(), "main");
    EXPECT_EQ(conn->dialect(), Dialect::SQLite);
}

TEST_F(DatabaseManagerTest, ConnectionsAreCached) {
    DatabaseManager manager(config_);

    EXPECT_EQ(manager.connection("main"), manager.connection());
    EXPECT_NE(manager.connection("main"), manager.connection("scratch"));
    EXPECT_EQ(manager.openCount(), 2u);
}

TEST_F(DatabaseManagerTest, UnknownConnectionIsNotFound) {
    DatabaseManager manager(config_);

    try {
        manager.connection("nope");
        FAIL() << "expected DatabaseException";
    } catch (const DatabaseException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
        EXPECT_STREQ(e.what(), "Database connection 'nope' is not configured");
    }
    EXPECT_EQ(manager.openCount(), 0u);
}

TEST_F(DatabaseManagerTest, UnsupportedDriver) {
    DatabaseManager manager(config_);

    try {
        manager.connection("legacy");
        FAIL() << "expected DatabaseException";
    } catch (const DatabaseException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Unsupported);
    }
}

TEST_F(DatabaseManagerTest, SetDefaultConnection) {
    DatabaseManager manager(config_);

    manager.setDefaultConnection("scratch");
    EXPECT_EQ(manager.defaultConnection(), "scratch");
    EXPECT_EQ(manager.connection()->name(), "scratch");

    EXPECT_THROW(manager.setDefaultConnection("nope"), DatabaseException);
    EXPECT_EQ(manager.defaultConnection(), "scratch");
}

TEST_F(DatabaseManagerTest, DefaultConnectionReadDuringSwitch) {
    DatabaseManager manager(config_);
    std::vector<int> unexpected(4, 0);

    std::thread writer([&manager] {
        for (int i = 0; i < 2000; ++i) {
            manager.setDefaultConnection(i % 2 == 0 ? "scratch" : "main");
        }
    });

    std::vector<std::thread> readers;
    for (size_t r = 0; r < unexpected.size(); ++r) {
        readers.emplace_back([&manager, &unexpected, r] {
            for (int i = 0; i < 2000; ++i) {
                std::string name = manager.defaultConnection();
                if (name != "main" && name != "scratch") {
                    ++unexpected[r];
                }
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_THAT(unexpected, ::testing::Each(0));
    EXPECT_EQ(manager.defaultConnection(), "main");
}

TEST_F(DatabaseManagerTest, StatementAndSelect) {
    DatabaseManager manager(config_);

    manager.statement("CREATE TABLE items (id INTEGER PRIMARY KEY, label TEXT)");
    auto result = manager.statement("INSERT INTO items (label) VALUES (?)", {Value("first")});
    EXPECT_EQ(result.rowsAffected(), 1);
    EXPECT_EQ(result.lastInsertId(), 1);

    Rows rows = manager.select("SELECT label FROM items WHERE id = ?", {Value(1)});
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].at("label"), Value("first"));
}

TEST_F(DatabaseManagerTest, TableOnNamedConnection) {
    DatabaseManager manager(config_);
    manager.connection("scratch")->exec("CREATE TABLE notes (body TEXT)");

    manager.table("notes", "scratch").insert({{"body", Value("hello")}});

    EXPECT_THAT(manager.table("notes", "scratch").pluck("body"), ElementsAre(Value("hello")));
    EXPECT_THROW(manager.table("notes").get(), SQLiteException);
}

TEST_F(DatabaseManagerTest, DisconnectClosesAndReopens) {
    DatabaseManager manager(config_);
    manager.statement("CREATE TABLE items (id INTEGER PRIMARY KEY)");

    auto first = manager.connection();
    manager.disconnect();

    EXPECT_FALSE(first->isOpen());
    EXPECT_EQ(manager.openCount(), 0u);

    auto second = manager.connection();
    EXPECT_NE(first, second);
    EXPECT_TRUE(second->isOpen());
    // File-backed data survives the reconnect
    EXPECT_EQ(manager.table("items").count(), 0);
}

TEST_F(DatabaseManagerTest, Reconnect) {
    DatabaseManager manager(config_);
    auto first = manager.connection("scratch");

    auto second = manager.reconnect("scratch");

    EXPECT_NE(first, second);
    EXPECT_FALSE(first->isOpen());
    EXPECT_EQ(manager.connection("scratch"), second);
}

TEST_F(DatabaseManagerTest, CloseAll) {
    DatabaseManager manager(config_);
    auto main = manager.connection("main");
    auto scratch = manager.connection("scratch");

    manager.closeAll();

    EXPECT_EQ(manager.openCount(), 0u);
    EXPECT_FALSE(main->isOpen());
    EXPECT_FALSE(scratch->isOpen());
}

TEST_F(DatabaseManagerTest, TransactionOnDefaultConnection) {
    DatabaseManager manager(config_);
    manager.statement("CREATE TABLE ledger (amount INTEGER)");

    manager.transaction([](Transaction& tx) {
        tx.table("ledger").insert({{"amount", Value(5)}});
        tx.table("ledger").insert({{"amount", Value(7)}});
    });

    EXPECT_DOUBLE_EQ(manager.table("ledger").sum("amount"), 12.0);

    auto tx = manager.beginTransaction();
    tx->table("ledger").remove();
    tx->rollback();

    EXPECT_EQ(manager.table("ledger").count(), 2);
}

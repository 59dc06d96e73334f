#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"
#include "QueryContext.hpp"
#include <sqlite3.h>
#include <thread>

using namespace sqlquery;
using namespace std::chrono_literals;

class ErrorHandlerTest : public ::testing::Test {
};

// SQLSTATE classification tests
TEST_F(ErrorHandlerTest, ConnectionClassMapsToConnection) {
    EXPECT_EQ(ErrorHandler::classifySqlState("08000"), ErrorKind::Connection);
    EXPECT_EQ(ErrorHandler::classifySqlState("08001"), ErrorKind::Connection);
    EXPECT_EQ(ErrorHandler::classifySqlState("08006"), ErrorKind::Connection);
    EXPECT_EQ(ErrorHandler::classifySqlState("57P01"), ErrorKind::Connection);
}

TEST_F(ErrorHandlerTest, IntegrityClassMapsToConstraint) {
    EXPECT_EQ(ErrorHandler::classifySqlState("23505"), ErrorKind::Constraint);  // unique
    EXPECT_EQ(ErrorHandler::classifySqlState("23503"), ErrorKind::Constraint);  // foreign key
    EXPECT_EQ(ErrorHandler::classifySqlState("23502"), ErrorKind::Constraint);  // not null
}

TEST_F(ErrorHandlerTest, SyntaxClassMapsToSyntax) {
    EXPECT_EQ(ErrorHandler::classifySqlState("42601"), ErrorKind::Syntax);
    EXPECT_EQ(ErrorHandler::classifySqlState("42501"), ErrorKind::Syntax);
}

TEST_F(ErrorHandlerTest, UndefinedObjectsMapToNotFound) {
    EXPECT_EQ(ErrorHandler::classifySqlState("42P01"), ErrorKind::NotFound);
    EXPECT_EQ(ErrorHandler::classifySqlState("42703"), ErrorKind::NotFound);
}

TEST_F(ErrorHandlerTest, ExactCodesWinOverClass) {
    EXPECT_EQ(ErrorHandler::classifySqlState("57014"), ErrorKind::Cancelled);
    EXPECT_EQ(ErrorHandler::classifySqlState("40P01"), ErrorKind::Busy);
    EXPECT_EQ(ErrorHandler::classifySqlState("40001"), ErrorKind::Busy);
    EXPECT_EQ(ErrorHandler::classifySqlState("55P03"), ErrorKind::Busy);
    EXPECT_EQ(ErrorHandler::classifySqlState("0A000"), ErrorKind::Unsupported);
}

TEST_F(ErrorHandlerTest, UnknownSqlStateMapsToOther) {
    EXPECT_EQ(ErrorHandler::classifySqlState("22012"), ErrorKind::Other);
    EXPECT_EQ(ErrorHandler::classifySqlState("XX000"), ErrorKind::Other);
    EXPECT_EQ(ErrorHandler::classifySqlState(""), ErrorKind::Other);
    EXPECT_EQ(ErrorHandler::classifySqlState("080"), ErrorKind::Other);
}

// SQLite result code classification tests
TEST_F(ErrorHandlerTest, SqliteConstraint) {
    EXPECT_EQ(ErrorHandler::classifySqlite(SQLITE_CONSTRAINT), ErrorKind::Constraint);
    EXPECT_EQ(ErrorHandler::classifySqlite(SQLITE_CONSTRAINT_UNIQUE), ErrorKind::Constraint);
    EXPECT_EQ(ErrorHandler::classifySqlite(SQLITE_CONSTRAINT_FOREIGNKEY), ErrorKind::Constraint);
}

TEST_F(ErrorHandlerTest, SqliteBusyAndLocked) {
    EXPECT_EQ(ErrorHandler::classifySqlite(SQLITE_BUSY), ErrorKind::Busy);
    EXPECT_EQ(ErrorHandler::classifySqlite(SQLITE_LOCKED), ErrorKind::Busy);
}

TEST_F(ErrorHandlerTest, SqliteOtherCodes) {
    EXPECT_EQ(ErrorHandler::classifySqlite(SQLITE_INTERRUPT), ErrorKind::Cancelled);
    EXPECT_EQ(ErrorHandler::classifySqlite(SQLITE_CANTOPEN), ErrorKind::Connection);
    EXPECT_EQ(ErrorHandler::classifySqlite(SQLITE_NOTADB), ErrorKind::Connection);
    EXPECT_EQ(ErrorHandler::classifySqlite(SQLITE_ERROR), ErrorKind::Syntax);
    EXPECT_EQ(ErrorHandler::classifySqlite(SQLITE_RANGE), ErrorKind::Unsupported);
    EXPECT_EQ(ErrorHandler::classifySqlite(SQLITE_MISUSE), ErrorKind::Unsupported);
    EXPECT_EQ(ErrorHandler::classifySqlite(SQLITE_IOERR), ErrorKind::Other);
}

TEST_F(ErrorHandlerTest, IsConnectionError) {
    EXPECT_TRUE(ErrorHandler::isConnectionError(ErrorKind::Connection));
    EXPECT_FALSE(ErrorHandler::isConnectionError(ErrorKind::Syntax));
    EXPECT_FALSE(ErrorHandler::isConnectionError(ErrorKind::Timeout));
}

TEST_F(ErrorHandlerTest, KindName) {
    EXPECT_STREQ(ErrorHandler::kindName(ErrorKind::Constraint), "constraint");
    EXPECT_STREQ(ErrorHandler::kindName(ErrorKind::NotFound), "not found");
    EXPECT_STREQ(ErrorHandler::kindName(ErrorKind::Other), "other");
}

// Exception tests
TEST_F(ErrorHandlerTest, PostgreSQLExceptionCarriesState) {
    PostgreSQLException e("23505", "duplicate key value violates unique constraint");

    EXPECT_EQ(e.sqlState(), "23505");
    EXPECT_EQ(e.kind(), ErrorKind::Constraint);
    EXPECT_STREQ(e.what(), "duplicate key value violates unique constraint");
}

TEST_F(ErrorHandlerTest, SQLiteExceptionCarriesCode) {
    SQLiteException e(SQLITE_CONSTRAINT_UNIQUE, "UNIQUE constraint failed: users.email");

    EXPECT_EQ(e.errorCode(), SQLITE_CONSTRAINT_UNIQUE);
    EXPECT_EQ(e.kind(), ErrorKind::Constraint);
}

TEST_F(ErrorHandlerTest, DatabaseExceptionIsRuntimeError) {
    try {
        throw DatabaseException(ErrorKind::Unsupported, "no last insert id");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "no last insert id");
    }
}

// Error context tests
TEST_F(ErrorHandlerTest, ErrorContextNesting) {
    EXPECT_TRUE(ErrorContext::current().empty());

    {
        ErrorContext ctx1("select users");
        EXPECT_EQ(ErrorContext::current(), "select users");

        {
            ErrorContext ctx2("COUNT users");
            EXPECT_EQ(ErrorContext::current(), "select users > COUNT users");
        }

        EXPECT_EQ(ErrorContext::current(), "select users");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

TEST_F(ErrorHandlerTest, ErrorContextIsThreadLocal) {
    ErrorContext ctx("main thread");

    std::string seen = "unset";
    std::thread worker([&seen] { seen = ErrorContext::current(); });
    worker.join();

    EXPECT_TRUE(seen.empty());
    EXPECT_EQ(ErrorContext::current(), "main thread");
}

// Query context tests
TEST_F(ErrorHandlerTest, BackgroundContextNeverExpires) {
    auto ctx = QueryContext::background();

    EXPECT_FALSE(ctx.isExpired());
    EXPECT_FALSE(ctx.deadline().has_value());
    EXPECT_FALSE(ctx.remaining().has_value());
    EXPECT_NO_THROW(ctx.check());
}

TEST_F(ErrorHandlerTest, CancelIsSharedBetweenCopies) {
    QueryContext ctx;
    QueryContext copy = ctx;

    copy.cancel();

    EXPECT_TRUE(ctx.isCancelled());
    try {
        ctx.check();
        FAIL() << "expected cancellation";
    } catch (const DatabaseException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Cancelled);
    }
}

TEST_F(ErrorHandlerTest, ExpiredDeadlineReportsTimeout) {
    auto ctx = QueryContext::withDeadline(QueryContext::Clock::now() - 1ms);

    EXPECT_TRUE(ctx.isExpired());
    EXPECT_EQ(ctx.remaining(), 0ms);
    try {
        ctx.check();
        FAIL() << "expected timeout";
    } catch (const DatabaseException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Timeout);
    }
}

TEST_F(ErrorHandlerTest, FutureDeadlineIsLive) {
    auto ctx = QueryContext::withTimeout(10s);

    EXPECT_FALSE(ctx.isExpired());
    ASSERT_TRUE(ctx.remaining().has_value());
    EXPECT_GT(ctx.remaining()->count(), 0);
}

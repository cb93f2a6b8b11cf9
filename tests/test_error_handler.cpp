#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"

using namespace querymind;

class ErrorHandlerTest : public ::testing::Test {
};

// SQLSTATE classification tests
TEST_F(ErrorHandlerTest, ConnectionClass) {
    EXPECT_TRUE(ErrorHandler::isConnectionError("08006"));
    EXPECT_TRUE(ErrorHandler::isConnectionError("08001"));
    EXPECT_TRUE(ErrorHandler::isConnectionError("57P01"));
    EXPECT_TRUE(ErrorHandler::isConnectionError("28P01"));
}

TEST_F(ErrorHandlerTest, IsNotConnectionError) {
    EXPECT_FALSE(ErrorHandler::isConnectionError(""));
    EXPECT_FALSE(ErrorHandler::isConnectionError("42P01"));
    EXPECT_FALSE(ErrorHandler::isConnectionError("57014"));
}

TEST_F(ErrorHandlerTest, StatementTimeout) {
    EXPECT_TRUE(ErrorHandler::isTimeout("57014"));
    EXPECT_TRUE(ErrorHandler::isTimeout("55P03"));
    EXPECT_FALSE(ErrorHandler::isTimeout("42601"));
}

TEST_F(ErrorHandlerTest, RaiseConnectionState) {
    try {
        ErrorHandler::raise("57P01", "terminating connection due to administrator command");
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.sqlState(), "57P01");
        EXPECT_STREQ(e.what(), "terminating connection due to administrator command");
    }
}

TEST_F(ErrorHandlerTest, RaiseQueryState) {
    try {
        ErrorHandler::raise("42P01", "relation \"orders\" does not exist");
        FAIL() << "expected DatabaseException";
    } catch (const ConnectionError&) {
        FAIL() << "undefined table is not a connection failure";
    } catch (const DatabaseException& e) {
        EXPECT_EQ(e.sqlState(), "42P01");
    }
}

TEST_F(ErrorHandlerTest, RaiseTimeoutKeepsState) {
    try {
        ErrorHandler::raise(ErrorHandler::STATE_QUERY_CANCELED, "canceling statement due to statement timeout");
        FAIL() << "expected DatabaseException";
    } catch (const DatabaseException& e) {
        EXPECT_TRUE(e.isTimeout());
    }
}

TEST_F(ErrorHandlerTest, Describe) {
    EXPECT_EQ(ErrorHandler::describe(""), "Unknown error");
    EXPECT_EQ(ErrorHandler::describe("57014"), "Statement timeout");
    EXPECT_EQ(ErrorHandler::describe("42P01"), "Relation does not exist");
    EXPECT_EQ(ErrorHandler::describe("42501"), "Permission denied");
    EXPECT_EQ(ErrorHandler::describe("25006"), "Write attempted in a read-only transaction");
    EXPECT_EQ(ErrorHandler::describe("08001"), "Connection exception");
    EXPECT_EQ(ErrorHandler::describe("42601"), "Syntax error or access rule violation");
    EXPECT_EQ(ErrorHandler::describe("XX000"), "PostgreSQL error XX000");
}

// ErrorContext tests
class ErrorContextTest : public ::testing::Test {
};

TEST_F(ErrorContextTest, SetAndGetContext) {
    EXPECT_TRUE(ErrorContext::current().empty());

    {
        ErrorContext ctx("table users");
        EXPECT_EQ(ErrorContext::current(), "table users");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

TEST_F(ErrorContextTest, NestedContext) {
    {
        ErrorContext ctx1("extract");
        EXPECT_EQ(ErrorContext::current(), "extract");

        {
            ErrorContext ctx2("table orders");
            EXPECT_EQ(ErrorContext::current(), "extract > table orders");
        }

        EXPECT_EQ(ErrorContext::current(), "extract");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

TEST_F(ErrorContextTest, ContextRestoredOnException) {
    try {
        ErrorContext ctx1("outer");
        {
            ErrorContext ctx2("inner");
            throw std::runtime_error("test");
        }
    } catch (const std::runtime_error&) {
        // Expected
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

// Exception types
TEST(DatabaseExceptionTest, CarriesSqlState) {
    DatabaseException e("57014", "canceling statement due to statement timeout");

    EXPECT_EQ(e.sqlState(), "57014");
    EXPECT_STREQ(e.what(), "canceling statement due to statement timeout");
    EXPECT_TRUE(e.isTimeout());
}

TEST(DatabaseExceptionTest, ConnectionErrorIsDatabaseException) {
    ConnectionError e("could not connect");

    EXPECT_EQ(e.sqlState(), ErrorHandler::STATE_CONNECTION_FAILURE);
    EXPECT_FALSE(e.isTimeout());
    EXPECT_THROW(throw ConnectionError("x"), DatabaseException);
}

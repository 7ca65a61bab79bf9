#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"
#include <sqlite3.h>
#include <cerrno>

using namespace uptime;

class ErrorHandlerTest : public ::testing::Test {
};

// SQLite result code classification tests
TEST_F(ErrorHandlerTest, MalformedStatementsAreProgrammingErrors) {
    EXPECT_EQ(ErrorHandler::classify(SQLITE_ERROR), ErrorBucket::Programming);
    EXPECT_EQ(ErrorHandler::classify(SQLITE_MISUSE), ErrorBucket::Programming);
    EXPECT_EQ(ErrorHandler::classify(SQLITE_RANGE), ErrorBucket::Programming);
}

TEST_F(ErrorHandlerTest, ConstraintViolationsAreIntegrityErrors) {
    EXPECT_EQ(ErrorHandler::classify(SQLITE_CONSTRAINT), ErrorBucket::Integrity);
    EXPECT_EQ(ErrorHandler::classify(SQLITE_MISMATCH), ErrorBucket::Integrity);
}

TEST_F(ErrorHandlerTest, ExtendedCodesUseTheirPrimaryCode) {
    EXPECT_EQ(ErrorHandler::classify(SQLITE_CONSTRAINT_UNIQUE), ErrorBucket::Integrity);
    EXPECT_EQ(ErrorHandler::classify(SQLITE_CONSTRAINT_FOREIGNKEY), ErrorBucket::Integrity);
    EXPECT_EQ(ErrorHandler::classify(SQLITE_IOERR_READ), ErrorBucket::Operational);
    EXPECT_EQ(ErrorHandler::classify(SQLITE_BUSY_SNAPSHOT), ErrorBucket::Operational);
}

TEST_F(ErrorHandlerTest, EnvironmentFailuresAreOperationalErrors) {
    EXPECT_EQ(ErrorHandler::classify(SQLITE_BUSY), ErrorBucket::Operational);
    EXPECT_EQ(ErrorHandler::classify(SQLITE_LOCKED), ErrorBucket::Operational);
    EXPECT_EQ(ErrorHandler::classify(SQLITE_CORRUPT), ErrorBucket::Operational);
    EXPECT_EQ(ErrorHandler::classify(SQLITE_NOTADB), ErrorBucket::Operational);
    EXPECT_EQ(ErrorHandler::classify(SQLITE_CANTOPEN), ErrorBucket::Operational);
    EXPECT_EQ(ErrorHandler::classify(SQLITE_READONLY), ErrorBucket::Operational);
    EXPECT_EQ(ErrorHandler::classify(SQLITE_FULL), ErrorBucket::Operational);
}

TEST_F(ErrorHandlerTest, OtherCodesAreGeneric) {
    EXPECT_EQ(ErrorHandler::classify(SQLITE_INTERNAL), ErrorBucket::Generic);
    EXPECT_EQ(ErrorHandler::classify(SQLITE_NOTFOUND), ErrorBucket::Generic);
}

TEST_F(ErrorHandlerTest, BucketNames) {
    EXPECT_STREQ(ErrorHandler::bucketName(ErrorBucket::Programming), "ProgrammingError");
    EXPECT_STREQ(ErrorHandler::bucketName(ErrorBucket::Integrity), "IntegrityError");
    EXPECT_STREQ(ErrorHandler::bucketName(ErrorBucket::Operational), "OperationalError");
    EXPECT_STREQ(ErrorHandler::bucketName(ErrorBucket::Generic), "DatabaseError");
}

// Status code tests
TEST_F(ErrorHandlerTest, StatusCodesAreNegativeErrno) {
    EXPECT_EQ(ErrorHandler::SUCCESS, 0);
    EXPECT_EQ(ErrorHandler::ERR_NOT_INITIALIZED, -ENOTCONN);
    EXPECT_EQ(ErrorHandler::ERR_INJECTION, -EPERM);
    EXPECT_EQ(ErrorHandler::ERR_ENGINE, -EIO);
    EXPECT_EQ(ErrorHandler::ERR_NOT_FOUND, -ENOENT);
    EXPECT_EQ(ErrorHandler::ERR_INVALID, -EINVAL);
}

TEST_F(ErrorHandlerTest, StatusToString) {
    EXPECT_EQ(ErrorHandler::statusToString(ErrorHandler::SUCCESS), "Success");
    EXPECT_EQ(ErrorHandler::statusToString(ErrorHandler::ERR_INJECTION),
              "Possible SQL injection detected");
    EXPECT_THAT(ErrorHandler::statusToString(12345), ::testing::HasSubstr("12345"));
}

TEST_F(ErrorHandlerTest, GetErrorMessageWithoutConnection) {
    EXPECT_EQ(ErrorHandler::getErrorMessage(nullptr), "No connection");
}

// ErrorContext tests
TEST_F(ErrorHandlerTest, ErrorContextNestsAndRestores) {
    EXPECT_TRUE(ErrorContext::current().empty());
    {
        ErrorContext outer("upsertRows websites");
        EXPECT_EQ(ErrorContext::current(), "upsertRows websites");
        {
            ErrorContext inner("updateRows websites");
            EXPECT_EQ(ErrorContext::current(), "upsertRows websites > updateRows websites");
        }
        EXPECT_EQ(ErrorContext::current(), "upsertRows websites");
    }
    EXPECT_TRUE(ErrorContext::current().empty());
}

// DatabaseException tests
TEST_F(ErrorHandlerTest, DatabaseExceptionCarriesCode) {
    DatabaseException e(SQLITE_CONSTRAINT_UNIQUE, "UNIQUE constraint failed: websites.url");

    EXPECT_EQ(e.errorCode(), SQLITE_CONSTRAINT_UNIQUE);
    EXPECT_EQ(e.bucket(), ErrorBucket::Integrity);
    EXPECT_STREQ(e.bucketName(), "IntegrityError");
    EXPECT_THAT(e.what(), ::testing::HasSubstr("websites.url"));
}

TEST_F(ErrorHandlerTest, DatabaseExceptionFromHandle) {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(":memory:", &db), SQLITE_OK);

    sqlite3_stmt* stmt = nullptr;
    EXPECT_NE(sqlite3_prepare_v2(db, "SELEC 1", -1, &stmt, nullptr), SQLITE_OK);

    DatabaseException e(db);
    EXPECT_EQ(e.bucket(), ErrorBucket::Programming);
    EXPECT_THAT(e.what(), ::testing::HasSubstr("syntax error"));

    sqlite3_finalize(stmt);
    sqlite3_close(db);
}

TEST_F(ErrorHandlerTest, DatabaseExceptionWithoutHandle) {
    DatabaseException e(static_cast<sqlite3*>(nullptr));

    EXPECT_EQ(e.errorCode(), SQLITE_MISUSE);
    EXPECT_STREQ(e.what(), "No connection");
}

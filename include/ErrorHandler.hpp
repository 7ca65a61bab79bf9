#pragma once

#include <sqlite3.h>
#include <string>
#include <stdexcept>
#include <cerrno>

namespace uptime {

// Coarse classification of SQLite result codes, used for logging only
enum class ErrorBucket {
    Programming,   // malformed statement, misuse, bad bind index
    Integrity,     // constraint violation, datatype mismatch
    Operational,   // busy, locked, corrupt, io, cannot open
    Generic
};

// SQLite error codes to status code mapping
class ErrorHandler {
public:
    // Classify an SQLite (extended) result code
    static ErrorBucket classify(int sqliteCode);

    // Bucket label used as a log prefix
    static const char* bucketName(ErrorBucket bucket);

    // Get human-readable message for a status code
    static std::string statusToString(int status);

    // Get human-readable message from an SQLite handle
    static std::string getErrorMessage(sqlite3* db);

    // Common status codes
    static constexpr int SUCCESS = 0;
    static constexpr int ERR_NOT_INITIALIZED = -ENOTCONN;
    static constexpr int ERR_INJECTION = -EPERM;
    static constexpr int ERR_ENGINE = -EIO;
    static constexpr int ERR_NOT_FOUND = -ENOENT;
    static constexpr int ERR_INVALID = -EINVAL;
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

// Exception for SQLite engine errors
class DatabaseException : public std::runtime_error {
public:
    DatabaseException(int sqliteCode, const std::string& message);
    DatabaseException(sqlite3* db);

    int errorCode() const { return m_errorCode; }
    ErrorBucket bucket() const { return ErrorHandler::classify(m_errorCode); }
    const char* bucketName() const { return ErrorHandler::bucketName(bucket()); }

private:
    int m_errorCode;
};

}  // namespace uptime

#include "ErrorHandler.hpp"

namespace uptime {

thread_local std::string ErrorContext::s_currentContext;

ErrorBucket ErrorHandler::classify(int sqliteCode) {
    // Extended codes carry the primary code in the low byte
    switch (sqliteCode & 0xff) {
        // Malformed statements and API misuse
        case SQLITE_ERROR:
        case SQLITE_MISUSE:
        case SQLITE_RANGE:
            return ErrorBucket::Programming;

        // Constraint violations
        case SQLITE_CONSTRAINT:
        case SQLITE_MISMATCH:
            return ErrorBucket::Integrity;

        // Engine state problems
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
        case SQLITE_CANTOPEN:
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_READONLY:
        case SQLITE_PROTOCOL:
        case SQLITE_NOMEM:
        case SQLITE_INTERRUPT:
        case SQLITE_PERM:
        case SQLITE_ABORT:
            return ErrorBucket::Operational;

        default:
            return ErrorBucket::Generic;
    }
}

const char* ErrorHandler::bucketName(ErrorBucket bucket) {
    switch (bucket) {
        case ErrorBucket::Programming:
            return "ProgrammingError";
        case ErrorBucket::Integrity:
            return "IntegrityError";
        case ErrorBucket::Operational:
            return "OperationalError";
        case ErrorBucket::Generic:
        default:
            return "DatabaseError";
    }
}

std::string ErrorHandler::statusToString(int status) {
    switch (status) {
        case SUCCESS:
            return "Success";
        case ERR_NOT_INITIALIZED:
            return "Database not initialized";
        case ERR_INJECTION:
            return "Possible SQL injection detected";
        case ERR_ENGINE:
            return "Database engine error";
        case ERR_NOT_FOUND:
            return "Not found";
        case ERR_INVALID:
            return "Invalid argument";
        default:
            return "Unknown status " + std::to_string(status);
    }
}

std::string ErrorHandler::getErrorMessage(sqlite3* db) {
    if (!db) {
        return "No connection";
    }
    const char* err = sqlite3_errmsg(db);
    if (err && *err) {
        return std::string(err);
    }
    return sqlite3_errstr(sqlite3_errcode(db));
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

DatabaseException::DatabaseException(int sqliteCode, const std::string& message)
    : std::runtime_error(message)
    , m_errorCode(sqliteCode) {
}

DatabaseException::DatabaseException(sqlite3* db)
    : std::runtime_error(ErrorHandler::getErrorMessage(db))
    , m_errorCode(db ? sqlite3_extended_errcode(db) : SQLITE_MISUSE) {
}

}  // namespace uptime

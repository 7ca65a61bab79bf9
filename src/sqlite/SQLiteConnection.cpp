/**
 * @file SQLiteConnection.cpp
 * @brief Implementation of the RAII SQLite connection wrapper.
 */

#include "SQLiteConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace uptime {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnection::SQLiteConnection(const std::string& dbPath) : m_path(dbPath) {
    int rc = sqlite3_open_v2(dbPath.c_str(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                             SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        m_openErrorCode = m_db ? sqlite3_extended_errcode(m_db) : rc;
        m_openError = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
        spdlog::error("Failed to open SQLite database '{}': {}", dbPath, m_openError);
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
        return;
    }
    sqlite3_extended_result_codes(m_db, 1);
}

SQLiteConnection::~SQLiteConnection() {
    close();
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteConnection::SQLiteConnection(SQLiteConnection&& other) noexcept
    : m_db(other.m_db)
    , m_path(std::move(other.m_path))
    , m_openErrorCode(other.m_openErrorCode)
    , m_openError(std::move(other.m_openError)) {
    other.m_db = nullptr;
}

SQLiteConnection& SQLiteConnection::operator=(SQLiteConnection&& other) noexcept {
    if (this != &other) {
        close();
        m_db = other.m_db;
        m_path = std::move(other.m_path);
        m_openErrorCode = other.m_openErrorCode;
        m_openError = std::move(other.m_openError);
        other.m_db = nullptr;
    }
    return *this;
}

// ============================================================================
// Query Execution
// ============================================================================

bool SQLiteConnection::execute(const std::string& sql) {
    if (!m_db) {
        spdlog::error("SQLite exec on closed connection: {}", sql);
        return false;
    }
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        spdlog::error("SQLite exec failed for '{}': {}", sql, errMsg ? errMsg : "unknown");
        if (errMsg) sqlite3_free(errMsg);
        return false;
    }
    return true;
}

SQLiteStatement SQLiteConnection::prepare(const std::string& sql) {
    if (!m_db) {
        throw DatabaseException(SQLITE_MISUSE, "Cannot prepare statement: connection is closed");
    }

    sqlite3_stmt* stmt = nullptr;
    const char* tail = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), static_cast<int>(sql.size()), &stmt, &tail);
    if (rc != SQLITE_OK) {
        throw DatabaseException(m_db);
    }

    SQLiteStatement statement(stmt);
    // Only one statement per call
    if (tail) {
        std::string rest(tail, sql.c_str() + sql.size() - tail);
        if (rest.find_first_not_of(" \t\r\n;") != std::string::npos) {
            throw DatabaseException(SQLITE_MISUSE,
                                    "You can only execute one statement at a time.");
        }
    }
    if (!statement) {
        throw DatabaseException(SQLITE_MISUSE, "Empty SQL statement");
    }
    return statement;
}

// ============================================================================
// Transactions
// ============================================================================

bool SQLiteConnection::inTransaction() const {
    return m_db && sqlite3_get_autocommit(m_db) == 0;
}

void SQLiteConnection::commit() {
    if (!inTransaction()) {
        return;
    }
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, "COMMIT", nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string message = errMsg ? errMsg : sqlite3_errstr(rc);
        if (errMsg) sqlite3_free(errMsg);
        throw DatabaseException(rc, message);
    }
}

void SQLiteConnection::close() noexcept {
    if (m_db) {
        int rc = sqlite3_close_v2(m_db);
        if (rc != SQLITE_OK) {
            spdlog::warn("SQLite close for '{}' returned {}", m_path, sqlite3_errstr(rc));
        }
        m_db = nullptr;
    }
}

// ============================================================================
// Error and Status Information
// ============================================================================

const char* SQLiteConnection::error() const {
    return m_db ? sqlite3_errmsg(m_db) : "no connection";
}

int SQLiteConnection::errorCode() const {
    return m_db ? sqlite3_extended_errcode(m_db) : SQLITE_MISUSE;
}

int64_t SQLiteConnection::lastInsertRowId() const {
    return m_db ? sqlite3_last_insert_rowid(m_db) : 0;
}

int SQLiteConnection::changes() const {
    return m_db ? sqlite3_changes(m_db) : 0;
}

}  // namespace uptime

#pragma once

/**
 * @file SQLiteConnection.hpp
 * @brief RAII wrapper for the single SQLite database handle.
 *
 * The monitor keeps exactly one open handle per database file. All access
 * to it is serialized by ConnectionManager; this class only owns the
 * handle and translates engine failures into DatabaseException.
 */

#include "SQLiteStatement.hpp"
#include <sqlite3.h>
#include <string>
#include <cstdint>

namespace uptime {

/**
 * @class SQLiteConnection
 * @brief RAII wrapper for an SQLite database file connection.
 *
 * The connection is opened with SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
 * SQLITE_OPEN_FULLMUTEX and closed when the object is destroyed or close()
 * is called.
 *
 * Usage:
 * @code
 *   SQLiteConnection conn("/var/lib/uptime/monitor.sqlite3");
 *   if (conn.isValid()) {
 *       conn.execute("PRAGMA foreign_keys=ON");
 *       SQLiteStatement stmt = conn.prepare("SELECT name FROM websites");
 *       while (stmt.step()) {
 *           // Use stmt.getValue(0)...
 *       }
 *   }
 * @endcode
 */
class SQLiteConnection {
public:
    /**
     * @brief Open a connection to an SQLite database file.
     * @param dbPath Path to the SQLite database file.
     *
     * Creates the database file if it doesn't exist. On failure the
     * connection is left invalid and openError() holds the reason.
     */
    explicit SQLiteConnection(const std::string& dbPath);

    /**
     * @brief Destructor - closes the database connection.
     */
    ~SQLiteConnection();

    // Non-copyable
    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    // Movable
    SQLiteConnection(SQLiteConnection&& other) noexcept;
    SQLiteConnection& operator=(SQLiteConnection&& other) noexcept;

    sqlite3* get() const { return m_db; }
    bool isValid() const { return m_db != nullptr; }
    const std::string& path() const { return m_path; }

    /**
     * @brief Execute SQL text without results, best-effort.
     * @return true on success, false on error (logged).
     *
     * Used for tuning pragmas and transaction control where the caller
     * decides whether a failure matters.
     */
    bool execute(const std::string& sql);

    /**
     * @brief Compile exactly one statement.
     * @throws DatabaseException when compilation fails or when text other
     *         than whitespace follows the first statement.
     */
    SQLiteStatement prepare(const std::string& sql);

    /**
     * @brief True while an explicit transaction is open.
     */
    bool inTransaction() const;

    /**
     * @brief Commit the open transaction, if any.
     * @throws DatabaseException when COMMIT fails.
     */
    void commit();

    /**
     * @brief Close the handle; later calls are no-ops.
     */
    void close() noexcept;

    const char* error() const;
    int errorCode() const;
    int openErrorCode() const { return m_openErrorCode; }
    const std::string& openError() const { return m_openError; }

    int64_t lastInsertRowId() const;
    int changes() const;

private:
    sqlite3* m_db = nullptr;    ///< SQLite database handle
    std::string m_path;         ///< Path to database file
    int m_openErrorCode = SQLITE_OK;
    std::string m_openError;
};

}  // namespace uptime

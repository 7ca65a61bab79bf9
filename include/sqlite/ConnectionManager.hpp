#pragma once

/**
 * @file ConnectionManager.hpp
 * @brief Serialized access to the single SQLite connection.
 *
 * One ConnectionManager owns one SQLiteConnection. Every statement runs
 * under the manager's mutex, so concurrent callers are serialized and
 * never interleave on the shared handle.
 */

#include "CellValue.hpp"
#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "SQLiteConnection.hpp"
#include "TimeFormatter.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace uptime {

class ConnectionManager;

/**
 * @class Cursor
 * @brief Caller-owned handle bound to the live connection.
 *
 * A Cursor lets a caller group several statements into one explicit
 * transaction: begin(), pass the cursor to executeAndCommit() without
 * asking for a commit, then commit() or rollback(). Statements passed a
 * cursor are never committed by the manager unless requested. While a
 * cursor transaction is open, statements issued without that cursor are
 * refused with an SQLITE_BUSY DatabaseException.
 *
 * Every operation on a Cursor whose connection was closed (or replaced
 * by a reopen) throws DatabaseException instead of touching stale state.
 */
class Cursor {
public:
    Cursor() = default;

    // Connection still open and the same one this cursor was bound to
    bool isValid() const;

    void begin();
    void commit();
    void rollback();
    bool inTransaction() const;

    // Rows changed by the last statement run through this cursor
    int rowsAffected() const { return m_rowsAffected; }
    int64_t lastInsertRowId() const { return m_lastInsertRowId; }

private:
    friend class ConnectionManager;

    struct SharedState;

    Cursor(std::weak_ptr<SharedState> state, std::weak_ptr<SQLiteConnection> connection);

    // Connection this cursor is bound to; the state mutex must be held
    static std::shared_ptr<SQLiteConnection> boundConnection(
        const SharedState& state, const std::weak_ptr<SQLiteConnection>& bound);

    std::weak_ptr<SharedState> m_state;
    std::weak_ptr<SQLiteConnection> m_connection;
    int m_rowsAffected = 0;
    int64_t m_lastInsertRowId = 0;
};

/**
 * @class ConnectionManager
 * @brief Owns the connection and runs statements one at a time.
 *
 * Engine failures are thrown as DatabaseException after being logged with
 * their bucket name (ProgrammingError, IntegrityError, OperationalError,
 * DatabaseError). The manager never retries.
 */
class ConnectionManager {
public:
    explicit ConnectionManager(DatabaseConfig config, TimeFormatter time = TimeFormatter{});
    ~ConnectionManager();

    // Non-copyable, non-movable
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Open the database file and apply tuning pragmas.
     *
     * journal_mode, busy_timeout and foreign_keys are applied best-effort:
     * a failure is logged and ignored. Opening an already open manager is
     * a no-op.
     *
     * @throws DatabaseException when the file cannot be opened.
     */
    void open();

    bool isOpen() const;

    /**
     * @brief Run one statement and commit it.
     * @param cursor Caller-owned cursor, or nullptr to use a private one.
     * @param commitProvidedCursor Commit even though the cursor belongs to
     *        the caller.
     * @return Number of rows changed by the statement.
     * @throws DatabaseException on engine failure, a closed connection, or a
     *         missing cursor while a caller transaction is open.
     */
    int executeAndCommit(const std::string& sql,
                         const std::vector<CellValue>& params = {},
                         Cursor* cursor = nullptr,
                         bool commitProvidedCursor = false);

    /**
     * @brief Run one query and return all of its rows.
     * @throws DatabaseException on engine failure or a closed connection.
     */
    std::vector<Row> executeAndFetchAll(const std::string& sql,
                                        const std::vector<CellValue>& params = {},
                                        Cursor* cursor = nullptr);

    /**
     * @brief executeAndCommit() reporting a status instead of throwing.
     * @return ErrorHandler::SUCCESS or ErrorHandler::ERR_ENGINE.
     */
    int runEditingCommand(const std::string& sql,
                          const std::vector<CellValue>& params,
                          const std::string& table,
                          const std::string& action);

    // SELECT 1 under the lock; false when closed or failing
    bool isAlive();

    /**
     * @brief Hand out a cursor bound to the live connection.
     * @throws DatabaseException when the manager is not open.
     */
    Cursor openCursor();

    // Release the connection; safe to call repeatedly
    void close() noexcept;

    const DatabaseConfig& config() const { return m_config; }
    const TimeFormatter& time() const { return m_time; }

private:
    std::shared_ptr<SQLiteConnection> connectionFor(const Cursor* cursor) const;
    void applyPragma(SQLiteConnection& conn, const std::string& pragma);
    void logFailure(const DatabaseException& e, const std::string& sql) const;

    DatabaseConfig m_config;
    TimeFormatter m_time;
    std::shared_ptr<Cursor::SharedState> m_state;
};

}  // namespace uptime

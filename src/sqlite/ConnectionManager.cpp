/**
 * @file ConnectionManager.cpp
 * @brief Implementation of serialized statement execution.
 */

#include "ConnectionManager.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace uptime {

struct Cursor::SharedState {
    std::mutex mutex;
    std::shared_ptr<SQLiteConnection> connection;
    bool callerTransaction = false;  // BEGIN issued through a Cursor
};

// ============================================================================
// Cursor
// ============================================================================

std::shared_ptr<SQLiteConnection> Cursor::boundConnection(
    const SharedState& state, const std::weak_ptr<SQLiteConnection>& bound) {
    auto conn = bound.lock();
    if (!conn || !state.connection || state.connection != conn || !conn->isValid()) {
        throw DatabaseException(SQLITE_MISUSE, "Cannot operate on a closed cursor.");
    }
    return conn;
}

Cursor::Cursor(std::weak_ptr<SharedState> state, std::weak_ptr<SQLiteConnection> connection)
    : m_state(std::move(state))
    , m_connection(std::move(connection)) {
}

bool Cursor::isValid() const {
    auto state = m_state.lock();
    if (!state) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    auto conn = m_connection.lock();
    return conn && state->connection == conn && conn->isValid();
}

void Cursor::begin() {
    auto state = m_state.lock();
    if (!state) {
        throw DatabaseException(SQLITE_MISUSE, "Cannot operate on a closed cursor.");
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    auto conn = boundConnection(*state, m_connection);
    if (conn->inTransaction()) {
        throw DatabaseException(SQLITE_MISUSE, "A transaction is already active.");
    }
    SQLiteStatement stmt = conn->prepare("BEGIN");
    stmt.step();
    state->callerTransaction = true;
}

void Cursor::commit() {
    auto state = m_state.lock();
    if (!state) {
        throw DatabaseException(SQLITE_MISUSE, "Cannot operate on a closed cursor.");
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    auto conn = boundConnection(*state, m_connection);
    conn->commit();
    state->callerTransaction = false;
}

void Cursor::rollback() {
    auto state = m_state.lock();
    if (!state) {
        throw DatabaseException(SQLITE_MISUSE, "Cannot operate on a closed cursor.");
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    auto conn = boundConnection(*state, m_connection);
    if (conn->inTransaction()) {
        SQLiteStatement stmt = conn->prepare("ROLLBACK");
        stmt.step();
    }
    state->callerTransaction = false;
}

bool Cursor::inTransaction() const {
    auto state = m_state.lock();
    if (!state) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    auto conn = m_connection.lock();
    return conn && state->connection == conn && conn->inTransaction();
}

// ============================================================================
// Lifecycle
// ============================================================================

ConnectionManager::ConnectionManager(DatabaseConfig config, TimeFormatter time)
    : m_config(std::move(config))
    , m_time(std::move(time))
    , m_state(std::make_shared<Cursor::SharedState>()) {
}

ConnectionManager::~ConnectionManager() {
    close();
}

void ConnectionManager::open() {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    if (m_state->connection) {
        return;
    }

    auto path = m_config.path();
    if (m_config.create_directory && path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            spdlog::warn("Could not create database directory '{}': {}",
                         path.parent_path().string(), ec.message());
        }
    }

    auto conn = std::make_shared<SQLiteConnection>(path.string());
    if (!conn->isValid()) {
        DatabaseException e(conn->openErrorCode(),
                            "Unable to open database '" + path.string() + "': " +
                            conn->openError());
        spdlog::error("{}: {}", e.bucketName(), e.what());
        throw e;
    }

    // Tuning is best-effort
    const auto& mode = m_config.journal_mode;
    if (!mode.empty() &&
        std::all_of(mode.begin(), mode.end(), [](unsigned char c) { return std::isalpha(c); })) {
        applyPragma(*conn, "PRAGMA journal_mode=" + mode);
    } else if (!mode.empty()) {
        spdlog::warn("Ignoring invalid journal mode '{}'", mode);
    }
    applyPragma(*conn, "PRAGMA busy_timeout=" + std::to_string(m_config.busy_timeout.count()));
    applyPragma(*conn, std::string("PRAGMA foreign_keys=") + (m_config.foreign_keys ? "ON" : "OFF"));

    m_state->connection = std::move(conn);
    m_state->callerTransaction = false;
    spdlog::info("Opened SQLite database {}", path.string());
}

bool ConnectionManager::isOpen() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->connection != nullptr;
}

void ConnectionManager::close() noexcept {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    if (!m_state->connection) {
        return;
    }
    if (m_state->connection->inTransaction()) {
        spdlog::warn("Closing database with an open transaction, it will be rolled back");
    }
    m_state->connection->close();
    m_state->connection.reset();
    m_state->callerTransaction = false;
    spdlog::info("Closed SQLite database {}", m_config.path().string());
}

void ConnectionManager::applyPragma(SQLiteConnection& conn, const std::string& pragma) {
    if (!conn.execute(pragma)) {
        spdlog::warn("Tuning statement '{}' failed, continuing", pragma);
    } else {
        spdlog::debug("Applied '{}'", pragma);
    }
}

// ============================================================================
// Statement Execution
// ============================================================================

std::shared_ptr<SQLiteConnection> ConnectionManager::connectionFor(const Cursor* cursor) const {
    if (cursor) {
        if (cursor->m_state.lock() != m_state) {
            throw DatabaseException(SQLITE_MISUSE,
                                    "Cursor does not belong to this connection manager.");
        }
        return Cursor::boundConnection(*m_state, cursor->m_connection);
    }
    if (!m_state->connection) {
        throw DatabaseException(SQLITE_MISUSE, "Cannot operate on a closed database.");
    }
    // A plain statement would otherwise run inside the caller's transaction
    if (m_state->callerTransaction) {
        throw DatabaseException(SQLITE_BUSY,
                                "A caller transaction is open; pass its cursor or wait "
                                "for it to end.");
    }
    return m_state->connection;
}

int ConnectionManager::executeAndCommit(const std::string& sql,
                                        const std::vector<CellValue>& params,
                                        Cursor* cursor,
                                        bool commitProvidedCursor) {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    try {
        auto conn = connectionFor(cursor);

        SQLiteStatement stmt = conn->prepare(sql);
        stmt.bindAll(params, m_time);
        while (stmt.step()) {
        }
        stmt.finalize();

        int changed = conn->changes();
        if (cursor) {
            cursor->m_rowsAffected = changed;
            cursor->m_lastInsertRowId = conn->lastInsertRowId();
        }

        // Never commit a transaction a caller opened unless asked to
        if (!cursor || commitProvidedCursor) {
            conn->commit();
            m_state->callerTransaction = false;
        }
        return changed;
    } catch (const DatabaseException& e) {
        logFailure(e, sql);
        throw;
    }
}

std::vector<Row> ConnectionManager::executeAndFetchAll(const std::string& sql,
                                                       const std::vector<CellValue>& params,
                                                       Cursor* cursor) {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    try {
        auto conn = connectionFor(cursor);

        SQLiteStatement stmt = conn->prepare(sql);
        stmt.bindAll(params, m_time);

        std::vector<Row> rows;
        while (stmt.step()) {
            rows.push_back(stmt.readRow());
        }
        stmt.finalize();

        if (!cursor) {
            conn->commit();
        }
        return rows;
    } catch (const DatabaseException& e) {
        logFailure(e, sql);
        throw;
    }
}

int ConnectionManager::runEditingCommand(const std::string& sql,
                                         const std::vector<CellValue>& params,
                                         const std::string& table,
                                         const std::string& action) {
    try {
        executeAndCommit(sql, params);
    } catch (const DatabaseException& e) {
        spdlog::error("Failed to {} data in '{}': {}", action, table, e.what());
        return ErrorHandler::ERR_ENGINE;
    }
    spdlog::debug("{} of '{}' committed", action, table);
    return ErrorHandler::SUCCESS;
}

bool ConnectionManager::isAlive() {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    if (!m_state->connection) {
        return false;
    }
    try {
        SQLiteStatement stmt = m_state->connection->prepare("SELECT 1");
        return stmt.step();
    } catch (const DatabaseException& e) {
        spdlog::warn("Connection liveness check failed: {}", e.what());
        return false;
    }
}

Cursor ConnectionManager::openCursor() {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    if (!m_state->connection) {
        throw DatabaseException(SQLITE_MISUSE, "Cannot open a cursor on a closed database.");
    }
    return Cursor(m_state, m_state->connection);
}

void ConnectionManager::logFailure(const DatabaseException& e, const std::string& sql) const {
    std::string context = ErrorContext::current();
    if (context.empty()) {
        spdlog::error("{}: {} (statement: {})", e.bucketName(), e.what(), sql);
    } else {
        spdlog::error("[{}] {}: {} (statement: {})", context, e.bucketName(), e.what(), sql);
    }
}

}  // namespace uptime

/**
 * @file SQLiteStatement.cpp
 * @brief Implementation of the RAII prepared statement wrapper.
 */

#include "SQLiteStatement.hpp"
#include "ErrorHandler.hpp"

namespace uptime {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteStatement::SQLiteStatement(sqlite3_stmt* stmt) : m_stmt(stmt) {}

SQLiteStatement::~SQLiteStatement() {
    finalize();
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteStatement::SQLiteStatement(SQLiteStatement&& other) noexcept
    : m_stmt(other.m_stmt) {
    other.m_stmt = nullptr;
}

SQLiteStatement& SQLiteStatement::operator=(SQLiteStatement&& other) noexcept {
    if (this != &other) {
        finalize();
        m_stmt = other.m_stmt;
        other.m_stmt = nullptr;
    }
    return *this;
}

// ============================================================================
// Parameter Binding
// ============================================================================

void SQLiteStatement::bind(int index, const CellValue& value, const TimeFormatter& time) {
    if (!m_stmt) {
        throw DatabaseException(SQLITE_MISUSE, "Cannot bind on a finalized statement");
    }

    int rc = SQLITE_OK;
    switch (value.index()) {
        case 0:
            rc = sqlite3_bind_null(m_stmt, index);
            break;
        case 1: {
            const auto& text = std::get<std::string>(value);
            rc = sqlite3_bind_text(m_stmt, index, text.c_str(),
                                   static_cast<int>(text.size()), SQLITE_TRANSIENT);
            break;
        }
        case 2:
            rc = sqlite3_bind_int64(m_stmt, index, std::get<int64_t>(value));
            break;
        case 3:
            rc = sqlite3_bind_double(m_stmt, index, std::get<double>(value));
            break;
        case 4:
        case 5: {
            std::string text = value.index() == 4 ? time.nowValue() : time.currentDateValue();
            rc = sqlite3_bind_text(m_stmt, index, text.c_str(),
                                   static_cast<int>(text.size()), SQLITE_TRANSIENT);
            break;
        }
        default:
            rc = SQLITE_MISMATCH;
            break;
    }

    if (rc != SQLITE_OK) {
        sqlite3* db = sqlite3_db_handle(m_stmt);
        throw DatabaseException(rc, std::string("Failed to bind parameter ") +
                                    std::to_string(index) + ": " +
                                    (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
    }
}

void SQLiteStatement::bindAll(const std::vector<CellValue>& values, const TimeFormatter& time) {
    if (static_cast<int>(values.size()) != parameterCount()) {
        throw DatabaseException(SQLITE_RANGE,
                                "Incorrect number of bindings supplied. The current statement uses " +
                                std::to_string(parameterCount()) + ", and there are " +
                                std::to_string(values.size()) + " supplied.");
    }
    for (size_t i = 0; i < values.size(); ++i) {
        bind(static_cast<int>(i) + 1, values[i], time);
    }
}

int SQLiteStatement::parameterCount() const {
    return m_stmt ? sqlite3_bind_parameter_count(m_stmt) : 0;
}

// ============================================================================
// Row Iteration
// ============================================================================

bool SQLiteStatement::step() {
    if (!m_stmt) return false;
    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw DatabaseException(sqlite3_db_handle(m_stmt));
}

// ============================================================================
// Column Access
// ============================================================================

int SQLiteStatement::columnCount() const {
    return m_stmt ? sqlite3_column_count(m_stmt) : 0;
}

std::string SQLiteStatement::columnName(int index) const {
    if (!m_stmt) return "";
    const char* name = sqlite3_column_name(m_stmt, index);
    return name ? name : "";
}

CellValue SQLiteStatement::getValue(int index) const {
    if (!m_stmt) return CellValue{};

    switch (sqlite3_column_type(m_stmt, index)) {
        case SQLITE_INTEGER:
            return CellValue(static_cast<int64_t>(sqlite3_column_int64(m_stmt, index)));
        case SQLITE_FLOAT:
            return CellValue(sqlite3_column_double(m_stmt, index));
        case SQLITE_NULL:
            return CellValue{};
        default: {
            const void* data = sqlite3_column_blob(m_stmt, index);
            int size = sqlite3_column_bytes(m_stmt, index);
            return CellValue(std::string(static_cast<const char*>(data), data ? size : 0));
        }
    }
}

Row SQLiteStatement::readRow() const {
    Row row;
    int count = columnCount();
    row.reserve(count);
    for (int i = 0; i < count; ++i) {
        row.push_back(getValue(i));
    }
    return row;
}

std::string SQLiteStatement::getString(int index) const {
    if (!m_stmt || isNull(index)) return "";
    const unsigned char* text = sqlite3_column_text(m_stmt, index);
    return text ? reinterpret_cast<const char*>(text) : "";
}

int64_t SQLiteStatement::getInt64(int index) const {
    if (!m_stmt) return 0;
    return sqlite3_column_int64(m_stmt, index);
}

bool SQLiteStatement::isNull(int index) const {
    if (!m_stmt) return true;
    return sqlite3_column_type(m_stmt, index) == SQLITE_NULL;
}

// ============================================================================
// Statement Management
// ============================================================================

void SQLiteStatement::reset() {
    if (m_stmt) {
        sqlite3_reset(m_stmt);
    }
}

void SQLiteStatement::finalize() {
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
    }
}

}  // namespace uptime

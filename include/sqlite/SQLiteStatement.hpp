#pragma once

/**
 * @file SQLiteStatement.hpp
 * @brief RAII wrapper for an SQLite prepared statement.
 *
 * Binds CellValue parameters, steps the statement and reads rows back as
 * CellValue sequences. The statement is finalized when the wrapper is
 * destroyed.
 */

#include "CellValue.hpp"
#include "TimeFormatter.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>

namespace uptime {

/**
 * @class SQLiteStatement
 * @brief Prepared statement with typed parameter binding.
 *
 * SQLite uses step() both to execute a statement and to fetch its rows.
 * For DML, a single step() returning false means the statement completed.
 *
 * Usage:
 * @code
 *   SQLiteStatement stmt = conn.prepare("SELECT id FROM websites WHERE url = ?");
 *   stmt.bindAll({CellValue(std::string("https://example.com"))}, time);
 *   while (stmt.step()) {
 *       Row row = stmt.readRow();
 *   }
 * @endcode
 *
 * Thread Safety:
 * - Not thread-safe; statements are used under the connection lock.
 */
class SQLiteStatement {
public:
    /**
     * @brief Construct a statement wrapper.
     * @param stmt sqlite3_stmt handle to manage (takes ownership), or nullptr.
     */
    explicit SQLiteStatement(sqlite3_stmt* stmt = nullptr);

    ~SQLiteStatement();

    // Non-copyable
    SQLiteStatement(const SQLiteStatement&) = delete;
    SQLiteStatement& operator=(const SQLiteStatement&) = delete;

    // Movable
    SQLiteStatement(SQLiteStatement&& other) noexcept;
    SQLiteStatement& operator=(SQLiteStatement&& other) noexcept;

    sqlite3_stmt* get() const { return m_stmt; }

    operator bool() const { return m_stmt != nullptr; }

    /**
     * @brief Bind one value to a 1-based parameter index.
     *
     * CurrentTimestamp and CurrentDate are resolved through @p time at this
     * point and bound as text.
     *
     * @throws DatabaseException on an invalid index or engine failure.
     */
    void bind(int index, const CellValue& value, const TimeFormatter& time);

    /**
     * @brief Bind all values in order.
     * @throws DatabaseException when the count does not match the statement.
     */
    void bindAll(const std::vector<CellValue>& values, const TimeFormatter& time);

    int parameterCount() const;

    /**
     * @brief Step to the next row.
     * @return true if a row is available, false when the statement is done.
     * @throws DatabaseException on any engine error.
     */
    bool step();

    int columnCount() const;
    std::string columnName(int index) const;

    /**
     * @brief Column value in its storage class.
     *
     * INTEGER maps to int64_t, REAL to double, NULL to std::monostate,
     * TEXT and BLOB to std::string.
     */
    CellValue getValue(int index) const;

    // All columns of the current row
    Row readRow() const;

    std::string getString(int index) const;
    int64_t getInt64(int index) const;
    bool isNull(int index) const;

    void reset();
    void finalize();

private:
    sqlite3_stmt* m_stmt;  ///< SQLite prepared statement handle (owned)
};

}  // namespace uptime

#pragma once

/**
 * @file QueryBoilerplate.hpp
 * @brief Schema introspection, DDL, DML and upsert over ConnectionManager.
 *
 * Every identifier that ends up in SQL text is checked by InjectionGuard
 * and quoted by Sanitizer. Every value is bound as a statement parameter.
 */

#include "CellValue.hpp"
#include "ConnectionManager.hpp"
#include "InjectionGuard.hpp"
#include "Predicate.hpp"
#include "Sanitizer.hpp"
#include "Schema.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace uptime {

// Ordering and limit applied to getRows
struct SelectOptions {
    std::string orderBy;
    bool descending = false;
    size_t limit = 0;  // 0 = no limit
};

/**
 * @class QueryBoilerplate
 * @brief Parameterized statements built from table and column names.
 *
 * All operations return an ErrorHandler status:
 * - SUCCESS
 * - ERR_NOT_INITIALIZED when the connection is not open
 * - ERR_INJECTION when a name or predicate failed the guard (nothing ran)
 * - ERR_INVALID for malformed arguments
 * - ERR_NOT_FOUND for an absent table or trigger
 * - ERR_ENGINE when SQLite reported an error (already logged)
 *
 * Exceptions from the connection layer never escape this class.
 */
class QueryBoilerplate {
public:
    QueryBoilerplate(ConnectionManager& connection,
                     const InjectionGuard& guard,
                     const Sanitizer& sanitizer);

    // ------------------------------------------------------------------
    // Introspection
    // ------------------------------------------------------------------

    int listTables(std::vector<std::string>& out);
    int listTriggers(std::vector<std::string>& out);
    int getTrigger(const std::string& name, TriggerDefinition& out);

    /**
     * @brief Column descriptors of a table, name first, in column order.
     * @return ERR_NOT_FOUND when the table does not exist.
     */
    int describeTable(const std::string& table, SchemaDescriptor& out);
    int getColumnNames(const std::string& table, std::vector<std::string>& out);

    // ------------------------------------------------------------------
    // DDL (all idempotent)
    // ------------------------------------------------------------------

    int createTable(const std::string& table, const std::vector<ColumnDefinition>& columns);
    int dropTable(const std::string& table);

    /**
     * @brief Create a trigger from its full CREATE TRIGGER statement.
     *
     * Succeeds without touching the database when a trigger with that
     * name already exists. The body must be a CREATE TRIGGER statement
     * that names the trigger.
     */
    int createTrigger(const std::string& name, const std::string& body);
    int dropTrigger(const std::string& name);
    // Drop (missing is fine) then create
    int replaceTrigger(const std::string& name, const std::string& body);

    // ------------------------------------------------------------------
    // DML
    // ------------------------------------------------------------------

    /**
     * @brief Insert one or more rows in a single statement.
     * @param columns Target columns; all table columns when empty.
     *
     * Cells go through Sanitizer::normalizeCell before binding. Rows longer
     * than the column list are truncated with a warning, shorter rows are
     * rejected.
     */
    int insertRows(const std::string& table, const std::vector<Row>& rows,
                   const std::vector<std::string>& columns = {});
    int insertRow(const std::string& table, const Row& row,
                  const std::vector<std::string>& columns = {});

    // Raw positional rows; columns empty or {"*"} selects everything
    int getRows(const std::string& table, const std::vector<std::string>& columns,
                const Predicate& predicate, std::vector<Row>& out,
                const SelectOptions& options = SelectOptions{});

    /**
     * @brief Beautified rows keyed by column name.
     * @return ERR_INVALID when nothing matched (see Sanitizer::reshapeRows).
     */
    int getRows(const std::string& table, const std::vector<std::string>& columns,
                const Predicate& predicate, std::vector<Record>& out,
                const SelectOptions& options = SelectOptions{});

    int countRows(const std::string& table, const std::string& column,
                  const Predicate& predicate, int64_t& out);

    // SET col = ? for each column; columns default to all table columns
    int updateRows(const std::string& table, const Row& values,
                   const std::vector<std::string>& columns,
                   const Predicate& predicate);

    int deleteRows(const std::string& table, const Predicate& predicate);

    /**
     * @brief Insert rows whose first column is new, update the others.
     *
     * The first column is the identity key. Existing keys are read once,
     * then rows are applied in order, each one committed on its own. On
     * the first failing row the upsert stops: rows before it stay
     * committed and the failing status is returned. Concurrent upserts
     * through the same instance are serialized.
     */
    int upsertRows(const std::string& table, const std::vector<Row>& rows,
                   const std::vector<std::string>& columns = {});
    int upsertRow(const std::string& table, const Row& row,
                  const std::vector<std::string>& columns = {});

private:
    int checkIdentifier(const std::string& name, const char* what) const;
    int checkColumns(const std::vector<std::string>& columns) const;
    int resolveColumns(const std::string& table, const std::vector<std::string>& requested,
                       std::vector<std::string>& out);
    int renderPredicate(const Predicate& predicate, std::string& clause,
                        std::vector<CellValue>& params) const;
    int renderOptions(const SelectOptions& options, std::string& clause) const;
    bool connected() const;

    ConnectionManager& m_connection;
    const InjectionGuard& m_guard;
    const Sanitizer& m_sanitizer;
    std::mutex m_upsertMutex;
};

}  // namespace uptime

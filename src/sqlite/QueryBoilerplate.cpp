/**
 * @file QueryBoilerplate.cpp
 * @brief Implementation of the statement builders.
 */

#include "QueryBoilerplate.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace uptime {

namespace {

bool selectsEverything(const std::vector<std::string>& columns) {
    return columns.empty() || (columns.size() == 1 && columns[0] == "*");
}

std::string upperTrimmed(const std::string& text) {
    std::string result;
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return result;
    result = text.substr(start);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

}  // namespace

QueryBoilerplate::QueryBoilerplate(ConnectionManager& connection,
                                   const InjectionGuard& guard,
                                   const Sanitizer& sanitizer)
    : m_connection(connection)
    , m_guard(guard)
    , m_sanitizer(sanitizer) {
}

// ============================================================================
// Helpers
// ============================================================================

bool QueryBoilerplate::connected() const {
    if (!m_connection.isOpen()) {
        spdlog::error("Database not initialized");
        return false;
    }
    return true;
}

int QueryBoilerplate::checkIdentifier(const std::string& name, const char* what) const {
    if (name.empty()) {
        spdlog::error("Empty {} name", what);
        return ErrorHandler::ERR_INVALID;
    }
    if (m_guard.hasSymbolOrCommand(name)) {
        spdlog::error("Injection detected in {} name '{}'", what, name);
        return ErrorHandler::ERR_INJECTION;
    }
    return ErrorHandler::SUCCESS;
}

int QueryBoilerplate::checkColumns(const std::vector<std::string>& columns) const {
    for (const auto& column : columns) {
        int rc = checkIdentifier(column, "column");
        if (rc != ErrorHandler::SUCCESS) {
            return rc;
        }
    }
    return ErrorHandler::SUCCESS;
}

int QueryBoilerplate::resolveColumns(const std::string& table,
                                     const std::vector<std::string>& requested,
                                     std::vector<std::string>& out) {
    if (!requested.empty()) {
        out = requested;
        return checkColumns(out);
    }
    return getColumnNames(table, out);
}

int QueryBoilerplate::renderPredicate(const Predicate& predicate, std::string& clause,
                                      std::vector<CellValue>& params) const {
    clause.clear();
    switch (predicate.kind()) {
        case Predicate::Kind::None:
            return ErrorHandler::SUCCESS;

        case Predicate::Kind::Fragments: {
            if (m_guard.hasSymbolOrCommand(predicate.fragments())) {
                spdlog::error("Injection detected in predicate");
                return ErrorHandler::ERR_INJECTION;
            }
            auto sanitized = m_sanitizer.quoteRiskyIdentifierInPredicate(predicate.fragments());
            clause = " WHERE ";
            for (size_t i = 0; i < sanitized.size(); ++i) {
                if (i > 0) clause += " AND ";
                clause += sanitized[i];
            }
            return ErrorHandler::SUCCESS;
        }

        case Predicate::Kind::Raw:
            if (m_guard.hasSymbolOrCommand(predicate.expression())) {
                spdlog::error("Injection detected in predicate '{}'", predicate.expression());
                return ErrorHandler::ERR_INJECTION;
            }
            clause = " WHERE " + predicate.expression();
            return ErrorHandler::SUCCESS;

        case Predicate::Kind::Equals: {
            int rc = checkIdentifier(predicate.column(), "column");
            if (rc != ErrorHandler::SUCCESS) {
                return rc;
            }
            clause = " WHERE " + Sanitizer::escapeIdentifier(predicate.column()) + " = ?";
            params.push_back(predicate.value());
            return ErrorHandler::SUCCESS;
        }
    }
    return ErrorHandler::ERR_INVALID;
}

int QueryBoilerplate::renderOptions(const SelectOptions& options, std::string& clause) const {
    clause.clear();
    if (!options.orderBy.empty()) {
        int rc = checkIdentifier(options.orderBy, "column");
        if (rc != ErrorHandler::SUCCESS) {
            return rc;
        }
        clause += " ORDER BY " + Sanitizer::escapeIdentifier(options.orderBy) +
                  (options.descending ? " DESC" : " ASC");
    }
    if (options.limit > 0) {
        clause += " LIMIT " + std::to_string(options.limit);
    }
    return ErrorHandler::SUCCESS;
}

// ============================================================================
// Introspection
// ============================================================================

int QueryBoilerplate::listTables(std::vector<std::string>& out) {
    out.clear();
    if (!connected()) return ErrorHandler::ERR_NOT_INITIALIZED;
    ErrorContext ctx("listTables");

    try {
        auto rows = m_connection.executeAndFetchAll(
            "SELECT name FROM sqlite_master WHERE type='table' "
            "AND name NOT LIKE 'sqlite_%' ORDER BY name");
        for (const auto& row : rows) {
            out.push_back(cellToString(row.at(0)));
        }
    } catch (const DatabaseException& e) {
        spdlog::error("Failed to list tables: {}", e.what());
        return ErrorHandler::ERR_ENGINE;
    }
    return ErrorHandler::SUCCESS;
}

int QueryBoilerplate::listTriggers(std::vector<std::string>& out) {
    out.clear();
    if (!connected()) return ErrorHandler::ERR_NOT_INITIALIZED;
    ErrorContext ctx("listTriggers");

    try {
        auto rows = m_connection.executeAndFetchAll(
            "SELECT name FROM sqlite_master WHERE type='trigger' ORDER BY name");
        for (const auto& row : rows) {
            out.push_back(cellToString(row.at(0)));
        }
    } catch (const DatabaseException& e) {
        spdlog::error("Failed to list triggers: {}", e.what());
        return ErrorHandler::ERR_ENGINE;
    }
    return ErrorHandler::SUCCESS;
}

int QueryBoilerplate::getTrigger(const std::string& name, TriggerDefinition& out) {
    if (!connected()) return ErrorHandler::ERR_NOT_INITIALIZED;
    int rc = checkIdentifier(name, "trigger");
    if (rc != ErrorHandler::SUCCESS) return rc;
    ErrorContext ctx("getTrigger " + name);

    try {
        auto rows = m_connection.executeAndFetchAll(
            "SELECT name, tbl_name, sql FROM sqlite_master WHERE type='trigger' AND name = ?",
            {CellValue(name)});
        if (rows.empty()) {
            spdlog::debug("Trigger '{}' does not exist", name);
            return ErrorHandler::ERR_NOT_FOUND;
        }
        const auto& row = rows.front();
        out.name = cellToString(row.at(0));
        out.table = cellToString(row.at(1));
        out.body = cellToString(row.at(2));
    } catch (const DatabaseException& e) {
        spdlog::error("Failed to read trigger '{}': {}", name, e.what());
        return ErrorHandler::ERR_ENGINE;
    }
    return ErrorHandler::SUCCESS;
}

int QueryBoilerplate::describeTable(const std::string& table, SchemaDescriptor& out) {
    out.clear();
    if (!connected()) return ErrorHandler::ERR_NOT_INITIALIZED;
    int rc = checkIdentifier(table, "table");
    if (rc != ErrorHandler::SUCCESS) return rc;
    ErrorContext ctx("describeTable " + table);

    try {
        // cid, name, type, notnull, dflt_value, pk
        auto rows = m_connection.executeAndFetchAll(
            "SELECT cid, name, type, \"notnull\", dflt_value, pk FROM pragma_table_info(?)",
            {CellValue(table)});
        if (rows.empty()) {
            spdlog::error("Table '{}' does not exist", table);
            return ErrorHandler::ERR_NOT_FOUND;
        }
        for (const auto& row : rows) {
            ColumnInfo col;
            col.name = cellToString(row.at(1));
            col.type = cellToString(row.at(2));
            col.nullable = cellToInt(row.at(3)) == 0;
            col.hasDefault = !isNull(row.at(4));
            col.defaultValue = cellToString(row.at(4));
            col.primaryKey = cellToInt(row.at(5)) > 0;
            col.ordinalPosition = static_cast<int>(cellToInt(row.at(0)));
            out.push_back(std::move(col));
        }
    } catch (const DatabaseException& e) {
        spdlog::error("Failed to describe table '{}': {}", table, e.what());
        return ErrorHandler::ERR_ENGINE;
    }
    return ErrorHandler::SUCCESS;
}

int QueryBoilerplate::getColumnNames(const std::string& table, std::vector<std::string>& out) {
    out.clear();
    SchemaDescriptor schema;
    int rc = describeTable(table, schema);
    if (rc != ErrorHandler::SUCCESS) {
        return rc;
    }
    out = columnNames(schema);
    return ErrorHandler::SUCCESS;
}

// ============================================================================
// DDL
// ============================================================================

int QueryBoilerplate::createTable(const std::string& table,
                                  const std::vector<ColumnDefinition>& columns) {
    if (!connected()) return ErrorHandler::ERR_NOT_INITIALIZED;
    int rc = checkIdentifier(table, "table");
    if (rc != ErrorHandler::SUCCESS) return rc;
    if (columns.empty()) {
        spdlog::error("Cannot create table '{}' without columns", table);
        return ErrorHandler::ERR_INVALID;
    }

    std::string sql = "CREATE TABLE IF NOT EXISTS " + Sanitizer::escapeIdentifier(table) + " (";
    for (size_t i = 0; i < columns.size(); ++i) {
        const auto& col = columns[i];
        rc = checkIdentifier(col.name, "column");
        if (rc != ErrorHandler::SUCCESS) return rc;
        // Declared types carry constraint keywords, only separators are refused
        if (m_guard.hasSymbolPattern(col.type)) {
            spdlog::error("Injection detected in type of column '{}'", col.name);
            return ErrorHandler::ERR_INJECTION;
        }
        if (i > 0) sql += ", ";
        sql += Sanitizer::escapeIdentifier(col.name);
        if (!col.type.empty()) {
            sql += " " + col.type;
        }
    }
    sql += ")";

    ErrorContext ctx("createTable " + table);
    return m_connection.runEditingCommand(sql, {}, table, "create");
}

int QueryBoilerplate::dropTable(const std::string& table) {
    if (!connected()) return ErrorHandler::ERR_NOT_INITIALIZED;
    int rc = checkIdentifier(table, "table");
    if (rc != ErrorHandler::SUCCESS) return rc;

    ErrorContext ctx("dropTable " + table);
    return m_connection.runEditingCommand(
        "DROP TABLE IF EXISTS " + Sanitizer::escapeIdentifier(table), {}, table, "drop");
}

int QueryBoilerplate::createTrigger(const std::string& name, const std::string& body) {
    if (!connected()) return ErrorHandler::ERR_NOT_INITIALIZED;
    int rc = checkIdentifier(name, "trigger");
    if (rc != ErrorHandler::SUCCESS) return rc;

    std::string normalized = upperTrimmed(body);
    if (normalized.rfind("CREATE TRIGGER", 0) != 0 &&
        normalized.rfind("CREATE TEMP TRIGGER", 0) != 0 &&
        normalized.rfind("CREATE TEMPORARY TRIGGER", 0) != 0) {
        spdlog::error("Trigger '{}' body is not a CREATE TRIGGER statement", name);
        return ErrorHandler::ERR_INVALID;
    }
    if (body.find(name) == std::string::npos) {
        spdlog::error("Trigger body does not define '{}'", name);
        return ErrorHandler::ERR_INVALID;
    }

    TriggerDefinition existing;
    rc = getTrigger(name, existing);
    if (rc == ErrorHandler::SUCCESS) {
        spdlog::info("Trigger '{}' already exists", name);
        return ErrorHandler::SUCCESS;
    }
    if (rc != ErrorHandler::ERR_NOT_FOUND) {
        return rc;
    }

    ErrorContext ctx("createTrigger " + name);
    return m_connection.runEditingCommand(body, {}, name, "create trigger");
}

int QueryBoilerplate::dropTrigger(const std::string& name) {
    if (!connected()) return ErrorHandler::ERR_NOT_INITIALIZED;
    int rc = checkIdentifier(name, "trigger");
    if (rc != ErrorHandler::SUCCESS) return rc;

    ErrorContext ctx("dropTrigger " + name);
    return m_connection.runEditingCommand(
        "DROP TRIGGER IF EXISTS " + Sanitizer::escapeIdentifier(name), {}, name, "drop trigger");
}

int QueryBoilerplate::replaceTrigger(const std::string& name, const std::string& body) {
    int rc = dropTrigger(name);
    if (rc != ErrorHandler::SUCCESS) {
        return rc;
    }
    return createTrigger(name, body);
}

// ============================================================================
// DML
// ============================================================================

int QueryBoilerplate::insertRows(const std::string& table, const std::vector<Row>& rows,
                                 const std::vector<std::string>& columns) {
    if (!connected()) return ErrorHandler::ERR_NOT_INITIALIZED;
    int rc = checkIdentifier(table, "table");
    if (rc != ErrorHandler::SUCCESS) return rc;
    if (rows.empty()) {
        spdlog::error("No rows to insert into '{}'", table);
        return ErrorHandler::ERR_INVALID;
    }

    std::vector<std::string> targets;
    rc = resolveColumns(table, columns, targets);
    if (rc != ErrorHandler::SUCCESS) return rc;

    std::string sql = "INSERT INTO " + Sanitizer::escapeIdentifier(table) +
                      " (" + m_sanitizer.columnList(targets) + ") VALUES ";
    std::string tuple = Sanitizer::placeholderTuple(targets.size());
    std::vector<CellValue> params;
    params.reserve(rows.size() * targets.size());

    for (size_t r = 0; r < rows.size(); ++r) {
        const auto& row = rows[r];
        if (row.size() < targets.size()) {
            spdlog::error("Row {} for '{}' has {} values, {} columns expected",
                          r, table, row.size(), targets.size());
            return ErrorHandler::ERR_INVALID;
        }
        if (row.size() > targets.size()) {
            spdlog::warn("Row {} for '{}' is longer than the column list, truncating", r, table);
        }
        if (r > 0) sql += ", ";
        sql += tuple;
        for (size_t i = 0; i < targets.size(); ++i) {
            params.push_back(m_sanitizer.normalizeCell(row[i]));
        }
    }

    ErrorContext ctx("insertRows " + table);
    return m_connection.runEditingCommand(sql, params, table, "insert");
}

int QueryBoilerplate::insertRow(const std::string& table, const Row& row,
                                const std::vector<std::string>& columns) {
    return insertRows(table, std::vector<Row>{row}, columns);
}

int QueryBoilerplate::getRows(const std::string& table, const std::vector<std::string>& columns,
                              const Predicate& predicate, std::vector<Row>& out,
                              const SelectOptions& options) {
    out.clear();
    if (!connected()) return ErrorHandler::ERR_NOT_INITIALIZED;
    int rc = checkIdentifier(table, "table");
    if (rc != ErrorHandler::SUCCESS) return rc;

    std::string selection = "*";
    if (!selectsEverything(columns)) {
        rc = checkColumns(columns);
        if (rc != ErrorHandler::SUCCESS) return rc;
        selection = m_sanitizer.columnList(columns);
    }

    std::string where;
    std::vector<CellValue> params;
    rc = renderPredicate(predicate, where, params);
    if (rc != ErrorHandler::SUCCESS) return rc;

    std::string tail;
    rc = renderOptions(options, tail);
    if (rc != ErrorHandler::SUCCESS) return rc;

    ErrorContext ctx("getRows " + table);
    try {
        out = m_connection.executeAndFetchAll(
            "SELECT " + selection + " FROM " + Sanitizer::escapeIdentifier(table) + where + tail,
            params);
    } catch (const DatabaseException& e) {
        spdlog::error("Failed to read rows from '{}': {}", table, e.what());
        return ErrorHandler::ERR_ENGINE;
    }
    return ErrorHandler::SUCCESS;
}

int QueryBoilerplate::getRows(const std::string& table, const std::vector<std::string>& columns,
                              const Predicate& predicate, std::vector<Record>& out,
                              const SelectOptions& options) {
    out.clear();
    std::vector<Row> rows;
    int rc = getRows(table, columns, predicate, rows, options);
    if (rc != ErrorHandler::SUCCESS) {
        return rc;
    }

    std::vector<std::string> names = columns;
    if (selectsEverything(columns)) {
        rc = getColumnNames(table, names);
        if (rc != ErrorHandler::SUCCESS) {
            return rc;
        }
    }
    return m_sanitizer.reshapeRows(names, rows, out);
}

int QueryBoilerplate::countRows(const std::string& table, const std::string& column,
                                const Predicate& predicate, int64_t& out) {
    out = 0;
    if (!connected()) return ErrorHandler::ERR_NOT_INITIALIZED;
    int rc = checkIdentifier(table, "table");
    if (rc != ErrorHandler::SUCCESS) return rc;

    std::string counted = "*";
    if (!column.empty() && column != "*") {
        rc = checkIdentifier(column, "column");
        if (rc != ErrorHandler::SUCCESS) return rc;
        counted = m_sanitizer.quoteRiskyIdentifier(column);
    }

    std::string where;
    std::vector<CellValue> params;
    rc = renderPredicate(predicate, where, params);
    if (rc != ErrorHandler::SUCCESS) return rc;

    ErrorContext ctx("countRows " + table);
    try {
        auto rows = m_connection.executeAndFetchAll(
            "SELECT COUNT(" + counted + ") FROM " + Sanitizer::escapeIdentifier(table) + where,
            params);
        if (!rows.empty() && !rows.front().empty()) {
            out = cellToInt(rows.front().front());
        }
    } catch (const DatabaseException& e) {
        spdlog::error("Failed to count rows of '{}': {}", table, e.what());
        return ErrorHandler::ERR_ENGINE;
    }
    return ErrorHandler::SUCCESS;
}

int QueryBoilerplate::updateRows(const std::string& table, const Row& values,
                                 const std::vector<std::string>& columns,
                                 const Predicate& predicate) {
    if (!connected()) return ErrorHandler::ERR_NOT_INITIALIZED;
    int rc = checkIdentifier(table, "table");
    if (rc != ErrorHandler::SUCCESS) return rc;

    std::vector<std::string> targets;
    rc = resolveColumns(table, columns, targets);
    if (rc != ErrorHandler::SUCCESS) return rc;

    if (values.size() < targets.size()) {
        spdlog::error("Update of '{}' has {} values for {} columns",
                      table, values.size(), targets.size());
        return ErrorHandler::ERR_INVALID;
    }
    if (values.size() > targets.size()) {
        spdlog::warn("Update of '{}' has more values than columns, truncating", table);
    }

    std::vector<CellValue> params;
    params.reserve(targets.size() + 1);
    for (size_t i = 0; i < targets.size(); ++i) {
        params.push_back(m_sanitizer.normalizeCell(values[i]));
    }

    std::string where;
    rc = renderPredicate(predicate, where, params);
    if (rc != ErrorHandler::SUCCESS) return rc;
    if (where.empty()) {
        spdlog::warn("Updating every row of '{}'", table);
    }

    ErrorContext ctx("updateRows " + table);
    return m_connection.runEditingCommand(
        "UPDATE " + Sanitizer::escapeIdentifier(table) + " SET " +
        m_sanitizer.assignmentList(targets) + where,
        params, table, "update");
}

int QueryBoilerplate::deleteRows(const std::string& table, const Predicate& predicate) {
    if (!connected()) return ErrorHandler::ERR_NOT_INITIALIZED;
    int rc = checkIdentifier(table, "table");
    if (rc != ErrorHandler::SUCCESS) return rc;

    std::string where;
    std::vector<CellValue> params;
    rc = renderPredicate(predicate, where, params);
    if (rc != ErrorHandler::SUCCESS) return rc;

    ErrorContext ctx("deleteRows " + table);
    return m_connection.runEditingCommand(
        "DELETE FROM " + Sanitizer::escapeIdentifier(table) + where, params, table, "delete");
}

// ============================================================================
// Upsert
// ============================================================================

int QueryBoilerplate::upsertRows(const std::string& table, const std::vector<Row>& rows,
                                 const std::vector<std::string>& columns) {
    if (!connected()) return ErrorHandler::ERR_NOT_INITIALIZED;
    int rc = checkIdentifier(table, "table");
    if (rc != ErrorHandler::SUCCESS) return rc;
    if (rows.empty()) {
        spdlog::error("No rows to upsert into '{}'", table);
        return ErrorHandler::ERR_INVALID;
    }

    std::lock_guard<std::mutex> lock(m_upsertMutex);
    ErrorContext ctx("upsertRows " + table);

    std::vector<std::string> targets;
    rc = resolveColumns(table, columns, targets);
    if (rc != ErrorHandler::SUCCESS) return rc;
    const std::string& key_column = targets.front();

    for (size_t i = 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        if (row.empty()) {
            spdlog::error("Upsert row {} for '{}' is empty", i, table);
            return ErrorHandler::ERR_INVALID;
        }

        // Bound comparison, so the key column's affinity decides equality
        Predicate identity = Predicate::equals(key_column, row.front());
        int64_t matches = 0;
        rc = countRows(table, "*", identity, matches);
        if (rc != ErrorHandler::SUCCESS) return rc;

        if (matches > 0) {
            rc = updateRows(table, row, targets, identity);
        } else {
            rc = insertRows(table, std::vector<Row>{row}, targets);
        }

        if (rc != ErrorHandler::SUCCESS) {
            spdlog::error("Upsert into '{}' stopped at row {}: {} row(s) already committed",
                          table, i, i);
            return rc;
        }
    }
    return ErrorHandler::SUCCESS;
}

int QueryBoilerplate::upsertRow(const std::string& table, const Row& row,
                                const std::vector<std::string>& columns) {
    return upsertRows(table, std::vector<Row>{row}, columns);
}

}  // namespace uptime

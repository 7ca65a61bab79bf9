#include "Sanitizer.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace uptime {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

}  // namespace

std::set<std::string> SanitizerConfig::defaultRiskyKeywords() {
    // SQL grammar words plus SQLite-specific reserved words
    return {
        "abort", "action", "add", "after", "all", "alter", "analyze", "and",
        "as", "asc", "attach", "autoincrement", "before", "begin", "between",
        "by", "cascade", "case", "cast", "check", "collate", "column",
        "commit", "conflict", "constraint", "create", "cross", "current",
        "current_date", "current_time", "current_timestamp", "database",
        "default", "deferred", "delete", "desc", "detach", "distinct", "do",
        "drop", "each", "else", "end", "escape", "except", "exclusive",
        "exists", "explain", "fail", "filter", "for", "foreign", "from",
        "full", "glob", "group", "having", "if", "ignore", "immediate", "in",
        "index", "indexed", "initially", "inner", "insert", "instead",
        "intersect", "into", "is", "isnull", "join", "key", "left", "like",
        "limit", "match", "natural", "no", "not", "notnull", "null", "of",
        "offset", "on", "or", "order", "outer", "over", "plan", "pragma",
        "primary", "query", "raise", "recursive", "references", "regexp",
        "reindex", "release", "rename", "replace", "restrict", "right",
        "rollback", "row", "rowid", "rows", "savepoint", "select", "set",
        "table", "temp", "temporary", "then", "to", "transaction", "trigger",
        "union", "unique", "update", "using", "vacuum", "values", "view",
        "virtual", "when", "where", "window", "with", "without"
    };
}

Sanitizer::Sanitizer(SanitizerConfig config, TimeFormatter time)
    : m_config(std::move(config))
    , m_time(std::move(time)) {
}

bool Sanitizer::isRiskyKeyword(const std::string& word) const {
    return m_config.riskyKeywords.count(toLower(word)) > 0;
}

bool Sanitizer::isLogicKeyword(const std::string& word) const {
    return m_config.logicKeywords.count(toLower(word)) > 0;
}

// ============================================================================
// Identifier quoting
// ============================================================================

std::string Sanitizer::escapeIdentifier(const std::string& id) {
    std::string result = "\"";
    for (char c : id) {
        if (c == '"') result += "\"\"";
        else result += c;
    }
    result += "\"";
    return result;
}

std::string Sanitizer::quoteRiskyIdentifier(const std::string& name) const {
    auto eq_pos = name.find('=');
    if (eq_pos != std::string::npos) {
        std::string key = name.substr(0, eq_pos);
        if (isRiskyKeyword(trim(key))) {
            spdlog::warn("Escaping risky column name '{}'", trim(key));
            return escapeIdentifier(trim(key)) + name.substr(eq_pos);
        }
        return name;
    }

    if (isRiskyKeyword(name)) {
        spdlog::warn("Escaping risky column name '{}'", name);
        return escapeIdentifier(name);
    }
    return name;
}

std::vector<std::string> Sanitizer::quoteRiskyIdentifier(
    const std::vector<std::string>& names) const {
    std::vector<std::string> result;
    result.reserve(names.size());
    for (const auto& name : names) {
        result.push_back(quoteRiskyIdentifier(name));
    }
    return result;
}

// ============================================================================
// Predicates
// ============================================================================

std::string Sanitizer::quoteRiskyIdentifierInPredicate(const std::string& fragment) const {
    auto eq_pos = fragment.find('=');
    if (eq_pos == std::string::npos) {
        std::string word = trim(fragment);
        if (!isLogicKeyword(word) && isRiskyKeyword(word)) {
            spdlog::warn("Escaping risky column name '{}'", word);
            return escapeIdentifier(word);
        }
        return fragment;
    }

    // Keep two-character comparison operators intact
    size_t op_start = eq_pos;
    if (eq_pos > 0 && (fragment[eq_pos - 1] == '!' || fragment[eq_pos - 1] == '<' ||
                       fragment[eq_pos - 1] == '>')) {
        op_start = eq_pos - 1;
    }

    std::string key = trim(fragment.substr(0, op_start));
    std::string op = fragment.substr(op_start, eq_pos - op_start + 1);
    std::string value = protectValue(trim(fragment.substr(eq_pos + 1)));

    if (!isLogicKeyword(key) && isRiskyKeyword(key)) {
        spdlog::warn("Escaping risky column name '{}'", key);
        key = escapeIdentifier(key);
    }
    return key + op + value;
}

std::vector<std::string> Sanitizer::quoteRiskyIdentifierInPredicate(
    const std::vector<std::string>& fragments) const {
    std::vector<std::string> result;
    result.reserve(fragments.size());
    for (const auto& fragment : fragments) {
        result.push_back(quoteRiskyIdentifierInPredicate(fragment));
    }
    return result;
}

std::string Sanitizer::protectValue(const std::string& value) const {
    if (value.empty()) {
        return "''";
    }
    // Back-ticked text names a column, so it is left as an identifier
    if (value.size() >= 2 && value.front() == '`' && value.back() == '`') {
        return value;
    }

    // Drop at most one pre-existing quote on each side
    std::string inner = value;
    if (!inner.empty() && inner.front() == '\'') {
        inner.erase(0, 1);
    }
    if (!inner.empty() && inner.back() == '\'') {
        inner.pop_back();
    }

    std::string result = "'";
    for (char c : inner) {
        if (c == '\'') result += "''";
        else result += c;
    }
    result += "'";
    return result;
}

std::string Sanitizer::protectValue(const CellValue& value) const {
    if (isNull(value)) {
        return "NULL";
    }
    if (isNumber(value)) {
        return cellToString(value);
    }
    if (std::holds_alternative<CurrentTimestamp>(value)) {
        return protectValue(m_time.nowValue());
    }
    if (std::holds_alternative<CurrentDate>(value)) {
        return protectValue(m_time.currentDateValue());
    }
    return protectValue(std::get<std::string>(value));
}

// ============================================================================
// Cell normalization
// ============================================================================

CellValue Sanitizer::normalizeCell(const CellValue& value) const {
    const auto* text = std::get_if<std::string>(&value);
    if (!text) {
        return value;
    }

    std::string token = toLower(*text);
    if (token == "now" || token == "now()") {
        return m_time.nowValue();
    }
    if (token == "current_date" || token == "current_date()") {
        return m_time.currentDateValue();
    }
    return value;
}

Row Sanitizer::normalizeRow(const Row& row) const {
    Row result;
    result.reserve(row.size());
    for (const auto& cell : row) {
        result.push_back(normalizeCell(cell));
    }
    return result;
}

// ============================================================================
// Row reshaping
// ============================================================================

int Sanitizer::reshapeRows(const std::vector<std::string>& columns,
                           const std::vector<Row>& rows,
                           std::vector<Record>& out) const {
    out.clear();
    if (columns.empty()) {
        spdlog::error("There are no provided table column names");
        return ErrorHandler::ERR_INVALID;
    }
    if (rows.empty()) {
        spdlog::error("There is no table content");
        return ErrorHandler::ERR_INVALID;
    }

    out.reserve(rows.size());
    for (const auto& row : rows) {
        if (row.size() != columns.size()) {
            spdlog::warn("Table content and column lengths do not correspond ({} vs {})",
                         row.size(), columns.size());
        }
        Record record;
        size_t width = std::min(row.size(), columns.size());
        for (size_t i = 0; i < width; ++i) {
            record[columns[i]] = row[i];
        }
        out.push_back(std::move(record));
    }
    return ErrorHandler::SUCCESS;
}

int Sanitizer::reshapeRows(const SchemaDescriptor& schema,
                           const std::vector<Row>& rows,
                           std::vector<Record>& out) const {
    return reshapeRows(columnNames(schema), rows, out);
}

// ============================================================================
// Statement fragments
// ============================================================================

std::string Sanitizer::assignmentList(const std::vector<std::string>& columns) const {
    std::string result;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) result += ", ";
        result += quoteRiskyIdentifier(columns[i]) + " = ?";
    }
    return result;
}

std::string Sanitizer::columnList(const std::vector<std::string>& columns) const {
    std::string result;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) result += ", ";
        result += quoteRiskyIdentifier(columns[i]);
    }
    return result;
}

std::string Sanitizer::placeholderTuple(size_t count) {
    std::string result = "(";
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) result += ", ";
        result += "?";
    }
    result += ")";
    return result;
}

}  // namespace uptime

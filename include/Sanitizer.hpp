#pragma once

#include "CellValue.hpp"
#include "Schema.hpp"
#include "TimeFormatter.hpp"
#include <set>
#include <string>
#include <vector>

namespace uptime {

struct SanitizerConfig {
    // Lower-case identifiers that must be quoted when used as column names
    std::set<std::string> riskyKeywords = defaultRiskyKeywords();
    // Lower-case words never treated as column names inside predicates
    std::set<std::string> logicKeywords = {"and", "or", "not"};

    static std::set<std::string> defaultRiskyKeywords();
};

/**
 * @class Sanitizer
 * @brief Identifier quoting, predicate literal protection and row shaping.
 *
 * Identifiers are quoted with SQLite's double-quote syntax, embedded quotes
 * doubled. Predicate values are protected as single-quoted string literals.
 * Values destined for INSERT or UPDATE are never rendered as text: they are
 * normalized here and bound by the statement layer.
 */
class Sanitizer {
public:
    explicit Sanitizer(SanitizerConfig config = SanitizerConfig{},
                       TimeFormatter time = TimeFormatter{});

    bool isRiskyKeyword(const std::string& word) const;

    /**
     * @brief Quote an identifier that collides with a risky keyword.
     *
     * "key=value" input only has its key half considered; the value is
     * kept verbatim.
     */
    std::string quoteRiskyIdentifier(const std::string& name) const;
    std::vector<std::string> quoteRiskyIdentifier(const std::vector<std::string>& names) const;

    /**
     * @brief Sanitize one predicate fragment.
     *
     * "key=value" (also !=, <=, >=) becomes key='value' with the key quoted
     * when risky and not a logical keyword. A bare risky word is quoted as
     * an identifier; anything else passes through unchanged.
     */
    std::string quoteRiskyIdentifierInPredicate(const std::string& fragment) const;
    std::vector<std::string> quoteRiskyIdentifierInPredicate(
        const std::vector<std::string>& fragments) const;

    // Render right-hand side text as a single-quoted literal
    std::string protectValue(const std::string& value) const;
    // NULL, bare numbers, quoted strings, resolved markers
    std::string protectValue(const CellValue& value) const;

    // Resolve now/current_date tokens; other values pass through
    CellValue normalizeCell(const CellValue& value) const;
    Row normalizeRow(const Row& row) const;

    /**
     * @brief Zip positional rows against column names.
     * @return SUCCESS, or ERR_INVALID when there are no columns or no rows.
     *
     * Rows of the wrong length are logged. A short row yields a record
     * holding only its own cells.
     */
    int reshapeRows(const std::vector<std::string>& columns,
                    const std::vector<Row>& rows,
                    std::vector<Record>& out) const;
    int reshapeRows(const SchemaDescriptor& schema,
                    const std::vector<Row>& rows,
                    std::vector<Record>& out) const;

    // "a = ?, b = ?" with risky names quoted
    std::string assignmentList(const std::vector<std::string>& columns) const;
    // "a, b" with risky names quoted
    std::string columnList(const std::vector<std::string>& columns) const;

    static std::string escapeIdentifier(const std::string& id);
    static std::string placeholderTuple(size_t count);

    const TimeFormatter& time() const { return m_time; }
    const SanitizerConfig& config() const { return m_config; }

private:
    bool isLogicKeyword(const std::string& word) const;

    SanitizerConfig m_config;
    TimeFormatter m_time;
};

}  // namespace uptime

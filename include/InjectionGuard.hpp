#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace uptime {

/**
 * @brief Value scanned by InjectionGuard: a string, a number, a null or an
 * arbitrarily nested list of those.
 *
 * Implicitly constructible from the shapes callers usually hold, so that
 * guard.hasSymbolPattern("name") and guard.scanCollection(rows) both read
 * naturally.
 */
class GuardInput {
public:
    using List = std::vector<GuardInput>;

    GuardInput() = default;  // null leaf
    GuardInput(const char* text) : m_value(std::string(text ? text : "")) {}
    GuardInput(std::string text) : m_value(std::move(text)) {}
    GuardInput(int value) : m_value(static_cast<int64_t>(value)) {}
    GuardInput(int64_t value) : m_value(value) {}
    GuardInput(double value) : m_value(value) {}
    GuardInput(List items) : m_value(std::move(items)) {}
    GuardInput(const std::vector<std::string>& items);
    GuardInput(const std::vector<std::vector<std::string>>& items);

    bool isNull() const { return std::holds_alternative<std::monostate>(m_value); }
    bool isString() const { return std::holds_alternative<std::string>(m_value); }
    bool isNumber() const {
        return std::holds_alternative<int64_t>(m_value) || std::holds_alternative<double>(m_value);
    }
    bool isList() const { return std::holds_alternative<List>(m_value); }

    const std::string& text() const { return std::get<std::string>(m_value); }
    const List& items() const { return std::get<List>(m_value); }

private:
    std::variant<std::monostate, std::string, int64_t, double, List> m_value;
};

// Pattern sets scanned by the guard
struct GuardConfig {
    std::vector<std::string> symbols = {";", "--", "/*", "*/"};
    std::vector<std::string> keywords = {
        "SELECT", "INSERT", "UPDATE", "DELETE", "DROP", "CREATE",
        "ALTER", "TABLE", "UNION", "JOIN", "WHERE"
    };
    std::vector<std::string> logicGates = {"OR", "AND", "NOT"};
    // Marker that introduces an inline base64 payload
    std::string base64Marker = ";base64";
};

/**
 * @class InjectionGuard
 * @brief Heuristic scorer for identifier and predicate text.
 *
 * The guard only looks for suspicious substrings; it does not parse SQL.
 * It is applied to text that is concatenated into statements (table names,
 * column names, raw predicates). Values are always bound as parameters
 * and never go through the guard.
 *
 * Every check returns true when the input looks dangerous. Lists are
 * scanned recursively, numbers are safe and null leaves count as dangerous.
 *
 * A string containing the base64 marker (";base64") is split at the
 * marker: the prefix is scanned as usual and the payload after it (with
 * its "," separator) is dangerous only when it is not valid base64.
 */
class InjectionGuard {
public:
    explicit InjectionGuard(GuardConfig config = GuardConfig{});

    bool hasSymbolPattern(const GuardInput& input) const;
    bool hasCommandKeyword(const GuardInput& input) const;
    bool hasLogicOperator(const GuardInput& input) const;

    bool hasSymbolOrCommand(const GuardInput& input) const;
    bool hasSymbolOrLogic(const GuardInput& input) const;
    bool hasCommandOrLogic(const GuardInput& input) const;
    bool hasAnyPattern(const GuardInput& input) const;

    // Symbol and command scan over nested lists, fail-closed on odd leaves
    bool scanCollection(const GuardInput& input) const;

    static bool isValidBase64(const std::string& text);

    const GuardConfig& config() const { return m_config; }

private:
    enum PatternSet : unsigned {
        SYMBOLS = 1u << 0,
        COMMANDS = 1u << 1,
        LOGIC = 1u << 2
    };

    bool scan(const GuardInput& input, unsigned sets, const char* check) const;
    bool scanText(const std::string& text, unsigned sets, const char* check) const;
    static const std::string* findAny(const std::string& text,
                                      const std::vector<std::string>& patterns);

    GuardConfig m_config;
};

}  // namespace uptime

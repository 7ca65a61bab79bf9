#pragma once

#include "CellValue.hpp"
#include <string>
#include <vector>

namespace uptime {

/**
 * @brief Row filter accepted by the query layer.
 *
 * - Fragments ("status=Down", "id='1'") are sanitized one by one and joined
 *   with AND.
 * - Raw text is a complete boolean expression; it is guarded but never
 *   rewritten.
 * - equals() builds "column" = ? with the value bound as a parameter.
 *
 * A default-constructed predicate matches every row.
 */
class Predicate {
public:
    enum class Kind { None, Fragments, Raw, Equals };

    Predicate() = default;
    Predicate(const char* fragment);
    Predicate(std::string fragment);
    Predicate(std::vector<std::string> fragments);

    static Predicate raw(std::string expression);
    static Predicate equals(std::string column, CellValue value);

    Kind kind() const { return m_kind; }
    bool empty() const { return m_kind == Kind::None; }

    const std::vector<std::string>& fragments() const { return m_fragments; }
    const std::string& expression() const { return m_expression; }
    const std::string& column() const { return m_expression; }
    const CellValue& value() const { return m_value; }

private:
    Kind m_kind = Kind::None;
    std::vector<std::string> m_fragments;
    std::string m_expression;  // raw text, or the column for equals()
    CellValue m_value;
};

}  // namespace uptime

#include "Predicate.hpp"

namespace uptime {

Predicate::Predicate(const char* fragment)
    : Predicate(std::string(fragment ? fragment : "")) {
}

Predicate::Predicate(std::string fragment) {
    if (!fragment.empty()) {
        m_kind = Kind::Fragments;
        m_fragments.push_back(std::move(fragment));
    }
}

Predicate::Predicate(std::vector<std::string> fragments) {
    for (auto& fragment : fragments) {
        if (!fragment.empty()) {
            m_fragments.push_back(std::move(fragment));
        }
    }
    if (!m_fragments.empty()) {
        m_kind = Kind::Fragments;
    }
}

Predicate Predicate::raw(std::string expression) {
    Predicate predicate;
    if (!expression.empty()) {
        predicate.m_kind = Kind::Raw;
        predicate.m_expression = std::move(expression);
    }
    return predicate;
}

Predicate Predicate::equals(std::string column, CellValue value) {
    Predicate predicate;
    predicate.m_kind = Kind::Equals;
    predicate.m_expression = std::move(column);
    predicate.m_value = std::move(value);
    return predicate;
}

}  // namespace uptime

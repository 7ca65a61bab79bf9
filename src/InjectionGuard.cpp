#include "InjectionGuard.hpp"
#include <spdlog/spdlog.h>

namespace uptime {

GuardInput::GuardInput(const std::vector<std::string>& items) {
    List list;
    list.reserve(items.size());
    for (const auto& item : items) {
        list.emplace_back(item);
    }
    m_value = std::move(list);
}

GuardInput::GuardInput(const std::vector<std::vector<std::string>>& items) {
    List list;
    list.reserve(items.size());
    for (const auto& item : items) {
        list.emplace_back(item);
    }
    m_value = std::move(list);
}

InjectionGuard::InjectionGuard(GuardConfig config) : m_config(std::move(config)) {}

// ============================================================================
// Individual checks
// ============================================================================

bool InjectionGuard::hasSymbolPattern(const GuardInput& input) const {
    return scan(input, SYMBOLS, "symbol");
}

bool InjectionGuard::hasCommandKeyword(const GuardInput& input) const {
    return scan(input, COMMANDS, "command");
}

bool InjectionGuard::hasLogicOperator(const GuardInput& input) const {
    return scan(input, LOGIC, "logic");
}

// ============================================================================
// Combinators
// ============================================================================

bool InjectionGuard::hasSymbolOrCommand(const GuardInput& input) const {
    return scan(input, SYMBOLS | COMMANDS, "symbol/command");
}

bool InjectionGuard::hasSymbolOrLogic(const GuardInput& input) const {
    return scan(input, SYMBOLS | LOGIC, "symbol/logic");
}

bool InjectionGuard::hasCommandOrLogic(const GuardInput& input) const {
    return scan(input, COMMANDS | LOGIC, "command/logic");
}

bool InjectionGuard::hasAnyPattern(const GuardInput& input) const {
    return scan(input, SYMBOLS | COMMANDS | LOGIC, "any");
}

bool InjectionGuard::scanCollection(const GuardInput& input) const {
    if (input.isList()) {
        for (const auto& item : input.items()) {
            if (scanCollection(item)) {
                return true;
            }
        }
        return false;
    }
    if (input.isNumber()) {
        return false;
    }
    if (!input.isString()) {
        spdlog::error("(Injection) expected a string or a number in collection");
        return true;
    }
    return scanText(input.text(), SYMBOLS | COMMANDS, "collection");
}

// ============================================================================
// Scanning
// ============================================================================

bool InjectionGuard::scan(const GuardInput& input, unsigned sets, const char* check) const {
    if (input.isList()) {
        for (const auto& item : input.items()) {
            if (scan(item, sets, check)) {
                return true;
            }
        }
        return false;
    }
    if (input.isString()) {
        return scanText(input.text(), sets, check);
    }
    if (input.isNumber()) {
        return false;
    }
    spdlog::error("(Injection) {} check: input must be a string or a list of strings", check);
    return true;
}

bool InjectionGuard::scanText(const std::string& text, unsigned sets, const char* check) const {
    std::string scanned = text;

    if (!m_config.base64Marker.empty()) {
        auto pos = text.find(m_config.base64Marker);
        if (pos != std::string::npos) {
            std::string payload = text.substr(pos + m_config.base64Marker.size());
            if (!payload.empty() && payload.front() == ',') {
                payload.erase(0, 1);
            }
            if (!isValidBase64(payload)) {
                spdlog::debug("(Injection) {} check failed: invalid base64 payload", check);
                return true;
            }
            scanned = text.substr(0, pos);
        }
    }

    const std::string* hit = nullptr;
    if (sets & SYMBOLS) {
        hit = findAny(scanned, m_config.symbols);
    }
    if (!hit && (sets & COMMANDS)) {
        hit = findAny(scanned, m_config.keywords);
    }
    if (!hit && (sets & LOGIC)) {
        hit = findAny(scanned, m_config.logicGates);
    }

    if (hit) {
        spdlog::debug("(Injection) {} check failed for '{}', node '{}' was found",
                      check, text, *hit);
        return true;
    }
    return false;
}

const std::string* InjectionGuard::findAny(const std::string& text,
                                           const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (!pattern.empty() && text.find(pattern) != std::string::npos) {
            return &pattern;
        }
    }
    return nullptr;
}

bool InjectionGuard::isValidBase64(const std::string& text) {
    if (text.size() % 4 != 0) {
        return false;
    }

    size_t padding = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '=') {
            // Padding only at the very end, at most two characters
            ++padding;
            if (padding > 2) return false;
            continue;
        }
        if (padding > 0) {
            return false;
        }
        bool alphabet = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                        (c >= '0' && c <= '9') || c == '+' || c == '/';
        if (!alphabet) {
            return false;
        }
    }
    return true;
}

}  // namespace uptime

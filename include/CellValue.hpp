#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace uptime {

// Placeholder resolved to the formatted local timestamp when bound
struct CurrentTimestamp {
    bool operator==(const CurrentTimestamp&) const { return true; }
    bool operator!=(const CurrentTimestamp&) const { return false; }
};

// Placeholder resolved to the formatted local date when bound
struct CurrentDate {
    bool operator==(const CurrentDate&) const { return true; }
    bool operator!=(const CurrentDate&) const { return false; }
};

// A single scalar bound into a statement or read back from one
using CellValue = std::variant<std::monostate, std::string, int64_t, double,
                               CurrentTimestamp, CurrentDate>;

// Positional row, ordered like the table's columns
using Row = std::vector<CellValue>;

// Beautified row: column name -> value
using Record = std::map<std::string, CellValue>;

inline bool isNull(const CellValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

inline bool isNumber(const CellValue& value) {
    return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value);
}

// Text form of a value; NULL becomes an empty string
std::string cellToString(const CellValue& value);

// Integer form of a value; reals truncate, unparsable text and NULL read as 0
int64_t cellToInt(const CellValue& value);

// Build a row of text cells, the common shape of command-line input
Row makeRow(const std::vector<std::string>& values);

}  // namespace uptime

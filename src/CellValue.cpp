#include "CellValue.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace uptime {

std::string cellToString(const CellValue& value) {
    switch (value.index()) {
        case 1:
            return std::get<std::string>(value);
        case 2:
            return std::to_string(std::get<int64_t>(value));
        case 3:
            // Shortest representation that round-trips
            return fmt::format("{}", std::get<double>(value));
        case 4:
            return "now";
        case 5:
            return "current_date";
        default:
            return "";
    }
}

int64_t cellToInt(const CellValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return *i;
    if (const auto* d = std::get_if<double>(&value)) return static_cast<int64_t>(*d);
    if (const auto* s = std::get_if<std::string>(&value)) {
        try {
            return std::stoll(*s);
        } catch (const std::logic_error&) {
            return 0;
        }
    }
    return 0;
}

Row makeRow(const std::vector<std::string>& values) {
    Row row;
    row.reserve(values.size());
    for (const auto& v : values) {
        row.emplace_back(v);
    }
    return row;
}

}  // namespace uptime

#include "FormatConverter.hpp"
#include <sstream>
#include <algorithm>

namespace uptime {

std::string FormatConverter::toCSV(const std::vector<std::string>& columns,
                                   const std::vector<Row>& rows,
                                   const CSVOptions& options) {
    std::ostringstream out;

    // Header
    if (options.includeHeader) {
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) out << options.delimiter;
            out << escapeCSVField(columns[i], options);
        }
        out << options.lineEnding;
    }

    // Rows, NULL as an empty field
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) out << options.delimiter;

            if (!isNull(row[i])) {
                out << escapeCSVField(cellToString(row[i]), options);
            }
        }
        out << options.lineEnding;
    }

    return out.str();
}

std::string FormatConverter::toJSON(const std::vector<std::string>& columns,
                                    const std::vector<Row>& rows,
                                    const JSONOptions& options) {
    json arr = json::array();

    for (const auto& row : rows) {
        json obj = json::object();

        for (size_t i = 0; i < std::min(columns.size(), row.size()); ++i) {
            if (!isNull(row[i])) {
                obj[columns[i]] = cellToJSON(row[i]);
            } else if (options.includeNull) {
                obj[columns[i]] = nullptr;
            }
        }

        arr.push_back(std::move(obj));
    }

    return dump(arr, options);
}

std::string FormatConverter::toJSON(const std::vector<Record>& records,
                                    const JSONOptions& options) {
    json arr = json::array();
    for (const auto& record : records) {
        arr.push_back(recordToObject(record, options));
    }
    return dump(arr, options);
}

std::string FormatConverter::rowToJSON(const Record& record, const JSONOptions& options) {
    json obj = recordToObject(record, options);
    return options.pretty ? obj.dump(options.indent) : obj.dump();
}

json FormatConverter::cellToJSON(const CellValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return *i;
    if (const auto* d = std::get_if<double>(&value)) return *d;
    if (isNull(value)) return nullptr;
    return cellToString(value);
}

json FormatConverter::recordToObject(const Record& record, const JSONOptions& options) {
    json obj = json::object();

    for (const auto& [key, value] : record) {
        if (!isNull(value)) {
            obj[key] = cellToJSON(value);
        } else if (options.includeNull) {
            obj[key] = nullptr;
        }
    }
    return obj;
}

std::string FormatConverter::dump(const json& array, const JSONOptions& options) {
    if (options.arrayFormat) {
        return options.pretty ? array.dump(options.indent) : array.dump();
    }
    json wrapper = json::object();
    wrapper["rows"] = array;
    return options.pretty ? wrapper.dump(options.indent) : wrapper.dump();
}

std::string FormatConverter::escapeCSVField(const std::string& field,
                                            const CSVOptions& options) {
    bool needs_quoting = options.quoteAll;

    if (!needs_quoting) {
        for (char c : field) {
            if (c == options.delimiter || c == options.quote ||
                c == '\n' || c == '\r') {
                needs_quoting = true;
                break;
            }
        }
    }

    if (!needs_quoting) {
        return field;
    }

    std::string result;
    result.reserve(field.size() + 2);
    result += options.quote;

    for (char c : field) {
        if (c == options.quote) {
            result += options.quote;  // Double the quote
        }
        result += c;
    }

    result += options.quote;
    return result;
}

}  // namespace uptime

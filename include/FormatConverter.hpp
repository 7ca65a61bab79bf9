#pragma once

#include "CellValue.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace uptime {

using json = nlohmann::json;

struct CSVOptions {
    char delimiter = ',';
    char quote = '"';
    std::string lineEnding = "\n";
    bool includeHeader = true;
    bool quoteAll = false;
};

struct JSONOptions {
    bool pretty = true;
    int indent = 2;
    bool includeNull = true;
    bool arrayFormat = true;  // true = array of objects, false = object with rows array
};

// Renders query results for the command line
class FormatConverter {
public:
    static std::string toCSV(const std::vector<std::string>& columns,
                             const std::vector<Row>& rows,
                             const CSVOptions& options = CSVOptions{});

    static std::string toJSON(const std::vector<std::string>& columns,
                              const std::vector<Row>& rows,
                              const JSONOptions& options = JSONOptions{});

    static std::string toJSON(const std::vector<Record>& records,
                              const JSONOptions& options = JSONOptions{});

    static std::string rowToJSON(const Record& record,
                                 const JSONOptions& options = JSONOptions{});

    // Markers are rendered by name ("now", "current_date")
    static json cellToJSON(const CellValue& value);

    static std::string escapeCSVField(const std::string& field,
                                      const CSVOptions& options = CSVOptions{});

private:
    static json recordToObject(const Record& record, const JSONOptions& options);
    static std::string dump(const json& array, const JSONOptions& options);
};

}  // namespace uptime

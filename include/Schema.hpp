#pragma once

#include <string>
#include <vector>

namespace uptime {

// One column of a table, name first regardless of how the engine orders it
struct ColumnInfo {
    std::string name;
    std::string type;
    bool nullable = true;
    std::string defaultValue;
    bool hasDefault = false;
    bool primaryKey = false;
    int ordinalPosition = 0;
};

using SchemaDescriptor = std::vector<ColumnInfo>;

// Column definition passed to createTable: identifier and declared type
struct ColumnDefinition {
    std::string name;
    std::string type;
};

struct TriggerDefinition {
    std::string name;
    std::string table;
    std::string body;  // full CREATE TRIGGER statement
};

inline std::vector<std::string> columnNames(const SchemaDescriptor& schema) {
    std::vector<std::string> names;
    names.reserve(schema.size());
    for (const auto& col : schema) {
        names.push_back(col.name);
    }
    return names;
}

}  // namespace uptime

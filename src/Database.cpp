#include "Database.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace uptime {

namespace {

SanitizerConfig sanitizerConfigFor(const SqlConfig& sql) {
    SanitizerConfig config;
    if (!sql.risky_keywords.empty()) {
        config.riskyKeywords.clear();
        for (auto keyword : sql.risky_keywords) {
            std::transform(keyword.begin(), keyword.end(), keyword.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            config.riskyKeywords.insert(keyword);
        }
    }
    return config;
}

}  // namespace

Database::Database(PrivateTag, const DatabaseConfig& config, const SqlConfig& sql)
    : m_time(sql.datetime_format, sql.date_format)
    , m_guard()
    , m_sanitizer(sanitizerConfigFor(sql), m_time)
    , m_connection(config, m_time) {
}

Database::~Database() {
    close();
}

std::unique_ptr<Database> Database::create(const DatabaseConfig& config, const SqlConfig& sql) {
    auto db = std::make_unique<Database>(PrivateTag{}, config, sql);
    db->m_connection.open();
    db->m_queries = std::make_unique<QueryBoilerplate>(db->m_connection, db->m_guard,
                                                       db->m_sanitizer);
    return db;
}

std::future<std::unique_ptr<Database>> Database::createAsync(DatabaseConfig config,
                                                             SqlConfig sql) {
    return std::async(std::launch::async,
                      [config = std::move(config), sql = std::move(sql)]() {
                          return create(config, sql);
                      });
}

void Database::close() noexcept {
    std::unique_lock<std::shared_mutex> lock(m_lifecycleMutex);
    if (!m_queries) {
        return;
    }
    m_queries.reset();
    m_connection.close();
}

bool Database::isOpen() const {
    std::shared_lock<std::shared_mutex> lock(m_lifecycleMutex);
    return m_queries != nullptr && m_connection.isOpen();
}

bool Database::isAlive() {
    std::shared_lock<std::shared_mutex> lock(m_lifecycleMutex);
    return m_queries != nullptr && m_connection.isAlive();
}

// ============================================================================
// Forwarded operations
// ============================================================================

int Database::listTables(std::vector<std::string>& out) {
    return withQueries("listTables", [&](QueryBoilerplate& q) { return q.listTables(out); });
}

int Database::listTriggers(std::vector<std::string>& out) {
    return withQueries("listTriggers", [&](QueryBoilerplate& q) { return q.listTriggers(out); });
}

int Database::getTrigger(const std::string& name, TriggerDefinition& out) {
    return withQueries("getTrigger", [&](QueryBoilerplate& q) { return q.getTrigger(name, out); });
}

int Database::describeTable(const std::string& table, SchemaDescriptor& out) {
    return withQueries("describeTable",
                       [&](QueryBoilerplate& q) { return q.describeTable(table, out); });
}

int Database::getColumnNames(const std::string& table, std::vector<std::string>& out) {
    return withQueries("getColumnNames",
                       [&](QueryBoilerplate& q) { return q.getColumnNames(table, out); });
}

int Database::createTable(const std::string& table, const std::vector<ColumnDefinition>& columns) {
    return withQueries("createTable",
                       [&](QueryBoilerplate& q) { return q.createTable(table, columns); });
}

int Database::dropTable(const std::string& table) {
    return withQueries("dropTable", [&](QueryBoilerplate& q) { return q.dropTable(table); });
}

int Database::createTrigger(const std::string& name, const std::string& body) {
    return withQueries("createTrigger",
                       [&](QueryBoilerplate& q) { return q.createTrigger(name, body); });
}

int Database::dropTrigger(const std::string& name) {
    return withQueries("dropTrigger", [&](QueryBoilerplate& q) { return q.dropTrigger(name); });
}

int Database::replaceTrigger(const std::string& name, const std::string& body) {
    return withQueries("replaceTrigger",
                       [&](QueryBoilerplate& q) { return q.replaceTrigger(name, body); });
}

int Database::insertRows(const std::string& table, const std::vector<Row>& rows,
                         const std::vector<std::string>& columns) {
    return withQueries("insertRows",
                       [&](QueryBoilerplate& q) { return q.insertRows(table, rows, columns); });
}

int Database::insertRow(const std::string& table, const Row& row,
                        const std::vector<std::string>& columns) {
    return withQueries("insertRow",
                       [&](QueryBoilerplate& q) { return q.insertRow(table, row, columns); });
}

int Database::getRows(const std::string& table, const std::vector<std::string>& columns,
                      const Predicate& predicate, std::vector<Row>& out,
                      const SelectOptions& options) {
    return withQueries("getRows", [&](QueryBoilerplate& q) {
        return q.getRows(table, columns, predicate, out, options);
    });
}

int Database::getRows(const std::string& table, const std::vector<std::string>& columns,
                      const Predicate& predicate, std::vector<Record>& out,
                      const SelectOptions& options) {
    return withQueries("getRows", [&](QueryBoilerplate& q) {
        return q.getRows(table, columns, predicate, out, options);
    });
}

int Database::countRows(const std::string& table, const std::string& column,
                        const Predicate& predicate, int64_t& out) {
    return withQueries("countRows", [&](QueryBoilerplate& q) {
        return q.countRows(table, column, predicate, out);
    });
}

int Database::updateRows(const std::string& table, const Row& values,
                         const std::vector<std::string>& columns, const Predicate& predicate) {
    return withQueries("updateRows", [&](QueryBoilerplate& q) {
        return q.updateRows(table, values, columns, predicate);
    });
}

int Database::deleteRows(const std::string& table, const Predicate& predicate) {
    return withQueries("deleteRows",
                       [&](QueryBoilerplate& q) { return q.deleteRows(table, predicate); });
}

int Database::upsertRows(const std::string& table, const std::vector<Row>& rows,
                         const std::vector<std::string>& columns) {
    return withQueries("upsertRows",
                       [&](QueryBoilerplate& q) { return q.upsertRows(table, rows, columns); });
}

int Database::upsertRow(const std::string& table, const Row& row,
                        const std::vector<std::string>& columns) {
    return withQueries("upsertRow",
                       [&](QueryBoilerplate& q) { return q.upsertRow(table, row, columns); });
}

}  // namespace uptime

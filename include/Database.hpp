#pragma once

#include "Config.hpp"
#include "ConnectionManager.hpp"
#include "ErrorHandler.hpp"
#include "InjectionGuard.hpp"
#include "QueryBoilerplate.hpp"
#include "Sanitizer.hpp"
#include "TimeFormatter.hpp"
#include <future>
#include <memory>
#include <shared_mutex>
#include <spdlog/spdlog.h>

namespace uptime {

/**
 * @class Database
 * @brief Entry point of the data layer.
 *
 * A Database only exists once its connection is open: create() either
 * returns a fully usable instance or throws DatabaseException. After
 * close(), every operation returns ErrorHandler::ERR_NOT_INITIALIZED.
 *
 * Operations may be called from any number of threads. close() waits for
 * operations already running.
 */
class Database {
    // Only create() can name this, so only create() can construct
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static std::unique_ptr<Database> create(const DatabaseConfig& config,
                                            const SqlConfig& sql = SqlConfig{});

    // Opens on a worker thread; the future rethrows open failures
    static std::future<std::unique_ptr<Database>> createAsync(DatabaseConfig config,
                                                              SqlConfig sql = SqlConfig{});

    Database(PrivateTag, const DatabaseConfig& config, const SqlConfig& sql);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Idempotent
    void close() noexcept;
    bool isOpen() const;
    bool isAlive();

    const TimeFormatter& time() const { return m_time; }
    const Sanitizer& sanitizer() const { return m_sanitizer; }
    const InjectionGuard& guard() const { return m_guard; }

    // Introspection
    int listTables(std::vector<std::string>& out);
    int listTriggers(std::vector<std::string>& out);
    int getTrigger(const std::string& name, TriggerDefinition& out);
    int describeTable(const std::string& table, SchemaDescriptor& out);
    int getColumnNames(const std::string& table, std::vector<std::string>& out);

    // DDL
    int createTable(const std::string& table, const std::vector<ColumnDefinition>& columns);
    int dropTable(const std::string& table);
    int createTrigger(const std::string& name, const std::string& body);
    int dropTrigger(const std::string& name);
    int replaceTrigger(const std::string& name, const std::string& body);

    // DML
    int insertRows(const std::string& table, const std::vector<Row>& rows,
                   const std::vector<std::string>& columns = {});
    int insertRow(const std::string& table, const Row& row,
                  const std::vector<std::string>& columns = {});
    int getRows(const std::string& table, const std::vector<std::string>& columns,
                const Predicate& predicate, std::vector<Row>& out,
                const SelectOptions& options = SelectOptions{});
    int getRows(const std::string& table, const std::vector<std::string>& columns,
                const Predicate& predicate, std::vector<Record>& out,
                const SelectOptions& options = SelectOptions{});
    int countRows(const std::string& table, const std::string& column,
                  const Predicate& predicate, int64_t& out);
    int updateRows(const std::string& table, const Row& values,
                   const std::vector<std::string>& columns, const Predicate& predicate);
    int deleteRows(const std::string& table, const Predicate& predicate);
    int upsertRows(const std::string& table, const std::vector<Row>& rows,
                   const std::vector<std::string>& columns = {});
    int upsertRow(const std::string& table, const Row& row,
                  const std::vector<std::string>& columns = {});

private:
    template<typename Func>
    int withQueries(const char* operation, Func&& func) {
        std::shared_lock<std::shared_mutex> lock(m_lifecycleMutex);
        if (!m_queries) {
            spdlog::error("{}: database not initialized", operation);
            return ErrorHandler::ERR_NOT_INITIALIZED;
        }
        return func(*m_queries);
    }

    TimeFormatter m_time;
    InjectionGuard m_guard;
    Sanitizer m_sanitizer;
    ConnectionManager m_connection;
    std::unique_ptr<QueryBoilerplate> m_queries;
    mutable std::shared_mutex m_lifecycleMutex;
};

}  // namespace uptime

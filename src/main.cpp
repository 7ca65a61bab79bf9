#include "Config.hpp"
#include "Database.hpp"
#include "FormatConverter.hpp"
#include "MonitorStore.hpp"
#include "StatusEvaluator.hpp"
#include "WebsiteCatalog.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <vector>

using namespace uptime;

namespace {

void setupLogging(bool debug, const std::string& logFile = "") {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(console_sink);

        std::string log_path = logFile.empty() ? "uptime-ledger.log" : logFile;
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
            file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex&) {
            // Fall back to user's home directory if the working directory is not writable
            const char* home = std::getenv("HOME");
            if (home) {
                log_path = std::string(home) + "/.uptime-ledger.log";
                try {
                    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
                    file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
                    sinks.push_back(file_sink);
                } catch (const spdlog::spdlog_ex& ex) {
                    std::cerr << "File logging disabled: " << ex.what() << std::endl;
                }
            }
        }

        auto logger = std::make_shared<spdlog::logger>("uptime-ledger", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void printCounts(const char* label, const StatusCounts& counts) {
    std::cout << "  " << label << ": up " << counts.up
              << " | partially up " << counts.partiallyUp
              << " | down " << counts.down
              << " | unknown " << counts.unknown << "\n";
}

// ============================================================================
// Subcommands
// ============================================================================

int runInit(MonitorStore& store) {
    if (store.initialise() != ErrorHandler::SUCCESS) {
        spdlog::error("Failed to initialise the monitor tables");
        return 1;
    }
    std::cout << "Database initialised" << std::endl;
    return 0;
}

int runSync(const Config& config, MonitorStore& store) {
    WebsiteCatalog catalog(config.monitor.default_case_sensitive);
    auto websites = catalog.loadFromFile(config.monitor.websites_file);
    if (!websites) {
        return 1;
    }

    if (store.initialise() != ErrorHandler::SUCCESS ||
        store.syncWebsites(*websites) != ErrorHandler::SUCCESS) {
        spdlog::error("Failed to synchronise websites from {}", config.monitor.websites_file);
        return 1;
    }
    std::cout << "Synchronised " << websites->size() << " website(s)" << std::endl;
    return 0;
}

int runRecord(const Config& config, MonitorStore& store) {
    std::vector<Website> websites;
    if (store.loadWebsites(websites) != ErrorHandler::SUCCESS) {
        return 1;
    }

    const Website* website = nullptr;
    for (const auto& candidate : websites) {
        if (candidate.url == config.command.url) {
            website = &candidate;
            break;
        }
    }
    if (!website) {
        spdlog::error("Website '{}' is not registered, run sync first", config.command.url);
        return 1;
    }

    FetchResult result;
    result.transportError = config.command.transport_error;
    result.httpStatus = config.command.http_status;
    if (!config.command.body_file.empty()) {
        std::ifstream body(config.command.body_file);
        if (!body.is_open()) {
            spdlog::error("Cannot open response body {}", config.command.body_file);
            return 1;
        }
        std::ostringstream content;
        content << body.rdbuf();
        result.body = content.str();
    }

    RecordedFetcher fetcher(std::move(result));
    StatusEvaluator evaluator(config.monitor.response_log_size);
    WebsiteStatus status = evaluator.check(*website, fetcher, config.monitor.query_timeout);

    if (store.recordStatus(website->url, status) != ErrorHandler::SUCCESS) {
        return 1;
    }
    std::cout << website->name << ": " << statusToString(status) << std::endl;
    return 0;
}

int runHistory(const Config& config, Database& db, MonitorStore& store) {
    std::vector<StatusEntry> entries;
    if (store.history(config.command.url, config.command.limit, entries) != ErrorHandler::SUCCESS) {
        return 1;
    }
    for (const auto& entry : entries) {
        std::cout << entry.checkedAt << "  " << statusToString(entry.status) << "\n";
    }

    UptimeSummary summary;
    if (store.uptimeSummary(config.command.url, TimeFormatter::Clock::now(), summary) !=
        ErrorHandler::SUCCESS) {
        return 1;
    }
    std::cout << "Uptime summary (" << db.time().currentDateValue() << ")\n";
    printCounts("Day", summary.day);
    printCounts("Week", summary.week);
    printCounts("Month", summary.month);
    printCounts("Year", summary.year);
    std::cout << std::flush;
    return 0;
}

int runTables(Database& db) {
    std::vector<std::string> tables;
    std::vector<std::string> triggers;
    if (db.listTables(tables) != ErrorHandler::SUCCESS ||
        db.listTriggers(triggers) != ErrorHandler::SUCCESS) {
        return 1;
    }
    std::cout << "Tables:\n";
    for (const auto& table : tables) {
        std::cout << "  " << table << "\n";
    }
    std::cout << "Triggers:\n";
    for (const auto& trigger : triggers) {
        std::cout << "  " << trigger << "\n";
    }
    std::cout << std::flush;
    return 0;
}

int runDump(const Config& config, Database& db) {
    const std::string& table = config.command.table;

    std::vector<std::string> columns;
    if (db.getColumnNames(table, columns) != ErrorHandler::SUCCESS) {
        spdlog::error("Unknown table '{}'", table);
        return 1;
    }

    std::vector<Row> rows;
    if (db.getRows(table, columns, Predicate(), rows) != ErrorHandler::SUCCESS) {
        return 1;
    }

    if (config.command.format == "csv") {
        std::cout << FormatConverter::toCSV(columns, rows);
    } else {
        std::cout << FormatConverter::toJSON(columns, rows) << std::endl;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Setup logging
    setupLogging(config.logging.debug, config.logging.file);

    // Validate configuration
    if (!config.validate()) {
        return 1;
    }

    spdlog::debug("Database: {}", config.database.path().string());

    std::unique_ptr<Database> db;
    try {
        db = Database::create(config.database, config.sql);
    } catch (const DatabaseException& e) {
        spdlog::error("Cannot open database {}: {} ({})", config.database.path().string(),
                      e.what(), e.bucketName());
        return 1;
    }

    MonitorStore store(*db);
    const std::string& command = config.command.name;

    int result = 1;
    if (command == "init") {
        result = runInit(store);
    } else if (command == "sync") {
        result = runSync(config, store);
    } else if (command == "record") {
        result = runRecord(config, store);
    } else if (command == "history") {
        result = runHistory(config, *db, store);
    } else if (command == "tables") {
        result = runTables(*db);
    } else if (command == "dump") {
        result = runDump(config, *db);
    } else {
        spdlog::error("Unknown command '{}'", command);
    }

    db->close();
    return result;
}

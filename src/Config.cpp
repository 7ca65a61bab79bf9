#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>

namespace uptime {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::string current;
    for (char c : str) {
        if (c == delimiter) {
            if (!trim(current).empty()) {
                result.push_back(trim(current));
            }
            current.clear();
        } else {
            current += c;
        }
    }
    if (!trim(current).empty()) {
        result.push_back(trim(current));
    }
    return result;
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

void applyDatabasePath(DatabaseConfig& database, const std::filesystem::path& path) {
    database.directory = path.has_parent_path() ? path.parent_path().string() : "";
    database.filename = path.filename().string();
}

}  // namespace

std::filesystem::path DatabaseConfig::path() const {
    if (filename == ":memory:") {
        return filename;
    }
    std::filesystem::path file(filename);
    if (file.is_absolute() || directory.empty()) {
        return file;
    }
    return std::filesystem::path(directory) / file;
}

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;
    int line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        try {
            if (current_section == "database") {
                if (key == "directory") config.database.directory = value;
                else if (key == "filename") config.database.filename = value;
                else if (key == "path") applyDatabasePath(config.database, value);
                else if (key == "busy_timeout_ms")
                    config.database.busy_timeout = std::chrono::milliseconds(std::stoi(value));
                else if (key == "journal_mode") config.database.journal_mode = value;
                else if (key == "foreign_keys") config.database.foreign_keys = parseBool(value);
                else if (key == "create_directory")
                    config.database.create_directory = parseBool(value);
            }
            else if (current_section == "monitor") {
                if (key == "websites_file") config.monitor.websites_file = value;
                else if (key == "check_interval")
                    config.monitor.check_interval = std::chrono::seconds(std::stoi(value));
                else if (key == "query_timeout")
                    config.monitor.query_timeout = std::chrono::seconds(std::stoi(value));
                else if (key == "response_log_size")
                    config.monitor.response_log_size = static_cast<size_t>(std::stoul(value));
                else if (key == "default_case_sensitive")
                    config.monitor.default_case_sensitive = parseBool(value);
            }
            else if (current_section == "sql") {
                if (key == "risky_keywords") config.sql.risky_keywords = split(value, ',');
                else if (key == "datetime_format") config.sql.datetime_format = value;
                else if (key == "date_format") config.sql.date_format = value;
            }
            else if (current_section == "logging") {
                if (key == "file") config.logging.file = value;
                else if (key == "debug") config.logging.debug = parseBool(value);
            }
        } catch (const std::logic_error&) {
            spdlog::warn("{}:{}: invalid value '{}' for '{}'", path.string(), line_number,
                         value, key);
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;

    CLI::App app{"uptime-ledger - Website uptime history stored in SQLite"};
    app.require_subcommand(1);

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    std::string database_path;
    auto* database_opt = app.add_option("-D,--database", database_path,
                                        "SQLite database file");
    int busy_timeout = 0;
    auto* busy_opt = app.add_option("--busy-timeout", busy_timeout,
                                    "Busy timeout in milliseconds");
    std::string log_file;
    auto* log_opt = app.add_option("-l,--log-file", log_file, "Log file path");
    bool debug = false;
    app.add_flag("-d,--debug", debug, "Enable debug output");

    // Subcommands
    auto* init_cmd = app.add_subcommand("init", "Create the tables and the trigger");

    auto* sync_cmd = app.add_subcommand("sync", "Load website definitions into the database");
    std::string websites_file;
    auto* websites_opt = sync_cmd->add_option("-w,--websites", websites_file,
                                              "Website definitions (JSON)");

    auto* record_cmd = app.add_subcommand("record", "Evaluate a fetched page and store the status");
    record_cmd->add_option("--url", config.command.url, "Website URL")->required();
    record_cmd->add_option("--http-status", config.command.http_status, "HTTP status code");
    record_cmd->add_option("--body-file", config.command.body_file, "File with the response body");
    record_cmd->add_flag("--transport-error", config.command.transport_error,
                         "The request itself failed");

    auto* history_cmd = app.add_subcommand("history", "Show recorded statuses of a website");
    history_cmd->add_option("--url", config.command.url, "Website URL")->required();
    history_cmd->add_option("-n,--limit", config.command.limit, "Number of entries")
        ->default_val(20);

    auto* tables_cmd = app.add_subcommand("tables", "List tables and triggers");

    auto* dump_cmd = app.add_subcommand("dump", "Print the content of a table");
    dump_cmd->add_option("-t,--table", config.command.table, "Table name")->required();
    dump_cmd->add_option("-f,--format", config.command.format, "Output format (json, csv)")
        ->default_val("json")
        ->check(CLI::IsMember({"json", "csv"}));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    for (auto* cmd : {init_cmd, sync_cmd, record_cmd, history_cmd, tables_cmd, dump_cmd}) {
        if (cmd->parsed()) {
            config.command.name = cmd->get_name();
        }
    }

    // Configuration file is the base, command line options override it
    if (config_file.empty()) {
        const char* env_config = std::getenv("UPTIME_CONFIG_FILE");
        if (env_config) {
            config_file = env_config;
        }
    }
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            CommandOptions command = std::move(config.command);
            config = std::move(*file_config);
            config.command = std::move(command);
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    config.resolveEnvironment();

    if (database_opt->count() > 0) {
        applyDatabasePath(config.database, database_path);
    }
    if (busy_opt->count() > 0) {
        config.database.busy_timeout = std::chrono::milliseconds(busy_timeout);
    }
    if (log_opt->count() > 0) {
        config.logging.file = log_file;
    }
    if (debug) {
        config.logging.debug = true;
    }
    if (websites_opt->count() > 0) {
        config.monitor.websites_file = websites_file;
    }

    return config;
}

bool Config::validate() const {
    if (database.filename.empty()) {
        spdlog::error("Database filename is required");
        return false;
    }

    if (database.busy_timeout.count() < 0) {
        spdlog::error("Busy timeout must not be negative: {} ms", database.busy_timeout.count());
        return false;
    }

    if (monitor.check_interval < MIN_CHECK_INTERVAL) {
        spdlog::error("Check interval must be at least {} seconds (got {})",
                      MIN_CHECK_INTERVAL.count(), monitor.check_interval.count());
        return false;
    }

    if (monitor.response_log_size == 0) {
        spdlog::error("Response log size must be positive");
        return false;
    }

    if (!database.directory.empty() && !database.create_directory &&
        !std::filesystem::is_directory(database.directory)) {
        spdlog::error("Database directory does not exist: {}", database.directory);
        return false;
    }

    if (command.name == "sync" && !std::filesystem::exists(monitor.websites_file)) {
        spdlog::error("Websites file not found: {}", monitor.websites_file);
        return false;
    }

    if (command.name == "record" && !command.body_file.empty() &&
        !std::filesystem::exists(command.body_file)) {
        spdlog::error("Body file not found: {}", command.body_file);
        return false;
    }

    return true;
}

void Config::resolveEnvironment() {
    const char* env_database = std::getenv("UPTIME_DATABASE");
    if (env_database && *env_database) {
        applyDatabasePath(database, env_database);
    }
    const char* env_websites = std::getenv("UPTIME_WEBSITES_FILE");
    if (env_websites && *env_websites) {
        monitor.websites_file = env_websites;
    }
}

}  // namespace uptime

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <filesystem>

namespace uptime {

struct DatabaseConfig {
    std::string directory = "data";
    std::string filename = "database.sqlite3";
    std::chrono::milliseconds busy_timeout{5000};
    std::string journal_mode = "WAL";
    bool foreign_keys = true;
    bool create_directory = true;

    // directory/filename, or filename alone when it is absolute
    std::filesystem::path path() const;
};

struct MonitorConfig {
    std::string websites_file = "websites.json";
    std::chrono::seconds check_interval{60};
    std::chrono::seconds query_timeout{5};
    size_t response_log_size = 500;
    bool default_case_sensitive = false;
};

struct SqlConfig {
    // Empty means the built-in risky keyword set
    std::vector<std::string> risky_keywords;
    std::string datetime_format = "%Y-%m-%d %H:%M:%S";
    std::string date_format = "%Y-%m-%d";
};

struct LoggingConfig {
    std::string file;
    bool debug = false;
};

// Arguments of the selected subcommand
struct CommandOptions {
    std::string name;
    std::string url;
    int http_status = 0;
    std::string body_file;
    bool transport_error = false;
    std::string table;
    std::string format = "json";
    size_t limit = 20;
};

struct Config {
    DatabaseConfig database;
    MonitorConfig monitor;
    SqlConfig sql;
    LoggingConfig logging;
    CommandOptions command;

    static constexpr std::chrono::seconds MIN_CHECK_INTERVAL{10};

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Fill unset values from UPTIME_* environment variables
    void resolveEnvironment();
};

}  // namespace uptime

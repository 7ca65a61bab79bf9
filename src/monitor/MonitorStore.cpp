#include "MonitorStore.hpp"
#include "ErrorHandler.hpp"
#include <ctime>
#include <map>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace uptime {

namespace {

const std::vector<std::string> kWebsiteColumns = {
    "url", "name", "channel", "expected_content", "expected_status", "case_sensitive"
};

const std::vector<std::string> kDeadCheckColumns = {
    "website_id", "keyword", "response", "case_sensitive"
};

const std::vector<std::string> kStatusColumns = {"website_id", "status", "checked_at"};

// Local midnight of the day containing t, shifted by dayOffset days
std::time_t localMidnight(std::time_t t, int dayOffset = 0) {
    std::tm tm{};
    localtime_r(&t, &tm);
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    tm.tm_mday += dayOffset;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

void tally(StatusCounts& counts, WebsiteStatus status) {
    switch (status) {
        case WebsiteStatus::Up:          ++counts.up; break;
        case WebsiteStatus::PartiallyUp: ++counts.partiallyUp; break;
        case WebsiteStatus::Down:        ++counts.down; break;
        case WebsiteStatus::Unknown:     ++counts.unknown; break;
    }
}

}  // namespace

MonitorStore::MonitorStore(Database& database) : m_database(database) {}

// ============================================================================
// Schema
// ============================================================================

int MonitorStore::initialise() {
    const std::string local_now = "DEFAULT (datetime('now', 'localtime'))";

    int rc = m_database.createTable(WEBSITES_TABLE, {
        {"id", "INTEGER PRIMARY KEY AUTOINCREMENT"},
        {"name", "TEXT NOT NULL"},
        {"url", "TEXT NOT NULL UNIQUE"},
        {"channel", "INTEGER NOT NULL"},
        {"expected_content", "TEXT NOT NULL"},
        {"expected_status", "INTEGER NOT NULL DEFAULT 200"},
        {"case_sensitive", "INTEGER NOT NULL DEFAULT 0"},
        {"created_at", "TEXT " + local_now},
        {"last_modified", "TEXT " + local_now},
    });
    if (rc != ErrorHandler::SUCCESS) return rc;

    rc = m_database.createTable(DEAD_CHECKS_TABLE, {
        {"id", "INTEGER PRIMARY KEY AUTOINCREMENT"},
        {"website_id", "INTEGER NOT NULL REFERENCES websites(id) ON DELETE CASCADE"},
        {"keyword", "TEXT NOT NULL"},
        {"response", "TEXT NOT NULL"},
        {"case_sensitive", "INTEGER NOT NULL DEFAULT 0"},
    });
    if (rc != ErrorHandler::SUCCESS) return rc;

    rc = m_database.createTable(STATUS_TABLE, {
        {"id", "INTEGER PRIMARY KEY AUTOINCREMENT"},
        {"website_id", "INTEGER NOT NULL REFERENCES websites(id) ON DELETE CASCADE"},
        {"status", "TEXT NOT NULL"},
        {"checked_at", "TEXT " + local_now},
    });
    if (rc != ErrorHandler::SUCCESS) return rc;

    return m_database.createTrigger(TOUCH_TRIGGER,
        std::string("CREATE TRIGGER ") + TOUCH_TRIGGER +
        " AFTER UPDATE ON websites FOR EACH ROW"
        " BEGIN"
        " UPDATE websites SET last_modified = datetime('now', 'localtime')"
        " WHERE id = OLD.id;"
        " END");
}

// ============================================================================
// Websites
// ============================================================================

int MonitorStore::syncWebsites(const std::vector<Website>& websites) {
    if (websites.empty()) {
        spdlog::warn("No websites to synchronise");
        return ErrorHandler::SUCCESS;
    }

    std::vector<Row> rows;
    rows.reserve(websites.size());
    for (const auto& site : websites) {
        rows.push_back(Row{
            site.url,
            site.name,
            site.channel,
            site.expectedContent,
            static_cast<int64_t>(site.expectedStatus),
            static_cast<int64_t>(site.caseSensitive ? 1 : 0),
        });
    }

    int rc = m_database.upsertRows(WEBSITES_TABLE, rows, kWebsiteColumns);
    if (rc != ErrorHandler::SUCCESS) {
        return rc;
    }

    for (const auto& site : websites) {
        int64_t id = 0;
        rc = websiteId(site.url, id);
        if (rc != ErrorHandler::SUCCESS) return rc;
        rc = replaceDeadChecks(id, site.deadChecks);
        if (rc != ErrorHandler::SUCCESS) return rc;
    }

    spdlog::info("Synchronised {} website(s)", websites.size());
    return ErrorHandler::SUCCESS;
}

int MonitorStore::loadWebsites(std::vector<Website>& out) {
    out.clear();

    std::vector<std::string> columns = {"id"};
    columns.insert(columns.end(), kWebsiteColumns.begin(), kWebsiteColumns.end());

    std::vector<Row> rows;
    SelectOptions options;
    options.orderBy = "id";
    int rc = m_database.getRows(WEBSITES_TABLE, columns, Predicate(), rows, options);
    if (rc != ErrorHandler::SUCCESS) return rc;

    for (const auto& row : rows) {
        if (row.size() < columns.size()) {
            continue;
        }
        Website site;
        site.url = cellToString(row[1]);
        site.name = cellToString(row[2]);
        site.channel = cellToInt(row[3]);
        site.expectedContent = cellToString(row[4]);
        site.expectedStatus = static_cast<int>(cellToInt(row[5]));
        site.caseSensitive = cellToInt(row[6]) != 0;

        rc = loadDeadChecks(cellToInt(row[0]), site.deadChecks);
        if (rc != ErrorHandler::SUCCESS) return rc;
        out.push_back(std::move(site));
    }
    return ErrorHandler::SUCCESS;
}

int MonitorStore::websiteId(const std::string& url, int64_t& out) {
    std::vector<Row> rows;
    int rc = m_database.getRows(WEBSITES_TABLE, {"id"}, Predicate::equals("url", url), rows);
    if (rc != ErrorHandler::SUCCESS) return rc;

    if (rows.empty() || rows.front().empty()) {
        spdlog::error("Website '{}' not found in the database", url);
        return ErrorHandler::ERR_NOT_FOUND;
    }
    out = cellToInt(rows.front().front());
    return ErrorHandler::SUCCESS;
}

int MonitorStore::replaceDeadChecks(int64_t websiteId, const std::vector<DeadCheck>& checks) {
    int rc = m_database.deleteRows(DEAD_CHECKS_TABLE, Predicate::equals("website_id", websiteId));
    if (rc != ErrorHandler::SUCCESS || checks.empty()) {
        return rc;
    }

    std::vector<Row> rows;
    rows.reserve(checks.size());
    for (const auto& check : checks) {
        rows.push_back(Row{
            websiteId,
            check.keyword,
            std::string(statusToString(check.response)),
            static_cast<int64_t>(check.caseSensitive ? 1 : 0),
        });
    }
    return m_database.insertRows(DEAD_CHECKS_TABLE, rows, kDeadCheckColumns);
}

int MonitorStore::loadDeadChecks(int64_t websiteId, std::vector<DeadCheck>& out) {
    std::vector<Row> rows;
    SelectOptions options;
    options.orderBy = "id";
    int rc = m_database.getRows(DEAD_CHECKS_TABLE, {"keyword", "response", "case_sensitive"},
                                Predicate::equals("website_id", websiteId), rows, options);
    if (rc != ErrorHandler::SUCCESS) return rc;

    for (const auto& row : rows) {
        if (row.size() < 3) {
            continue;
        }
        auto response = statusFromString(cellToString(row[1]));
        if (!response) {
            spdlog::warn("Skipping dead check '{}' with unknown response '{}'",
                         cellToString(row[0]), cellToString(row[1]));
            continue;
        }
        DeadCheck check;
        check.keyword = cellToString(row[0]);
        check.response = *response;
        check.caseSensitive = cellToInt(row[2]) != 0;
        out.push_back(std::move(check));
    }
    return ErrorHandler::SUCCESS;
}

// ============================================================================
// Status history
// ============================================================================

int MonitorStore::recordStatus(const std::string& url, WebsiteStatus status) {
    int64_t id = 0;
    int rc = websiteId(url, id);
    if (rc != ErrorHandler::SUCCESS) return rc;

    rc = m_database.insertRow(STATUS_TABLE,
                              Row{id, std::string(statusToString(status)), CurrentTimestamp{}},
                              kStatusColumns);
    if (rc == ErrorHandler::SUCCESS) {
        spdlog::info("Recorded '{}' for '{}'", statusToString(status), url);
    }
    return rc;
}

int MonitorStore::latestStatus(const std::string& url, StatusEntry& out) {
    std::vector<StatusEntry> entries;
    int rc = history(url, 1, entries);
    if (rc != ErrorHandler::SUCCESS) return rc;

    if (entries.empty()) {
        spdlog::info("No status recorded yet for '{}'", url);
        return ErrorHandler::ERR_NOT_FOUND;
    }
    out = entries.front();
    return ErrorHandler::SUCCESS;
}

int MonitorStore::history(const std::string& url, size_t limit, std::vector<StatusEntry>& out) {
    out.clear();

    int64_t id = 0;
    int rc = websiteId(url, id);
    if (rc != ErrorHandler::SUCCESS) return rc;

    std::vector<Row> rows;
    SelectOptions options;
    options.orderBy = "id";
    options.descending = true;
    options.limit = limit;
    rc = m_database.getRows(STATUS_TABLE, {"status", "checked_at"},
                            Predicate::equals("website_id", id), rows, options);
    if (rc != ErrorHandler::SUCCESS) return rc;

    out.reserve(rows.size());
    for (const auto& row : rows) {
        if (row.size() < 2) {
            continue;
        }
        StatusEntry entry;
        entry.status = statusFromString(cellToString(row[0])).value_or(WebsiteStatus::Unknown);
        entry.checkedAt = cellToString(row[1]);
        out.push_back(std::move(entry));
    }
    return ErrorHandler::SUCCESS;
}

int MonitorStore::uptimeSummary(const std::string& url, TimeFormatter::Clock::time_point now,
                                UptimeSummary& out) {
    std::vector<StatusEntry> entries;
    int rc = history(url, 0, entries);
    if (rc != ErrorHandler::SUCCESS) return rc;

    out = summarize(entries, m_database.time(), now);
    return ErrorHandler::SUCCESS;
}

UptimeSummary MonitorStore::summarize(const std::vector<StatusEntry>& entries,
                                      const TimeFormatter& time,
                                      TimeFormatter::Clock::time_point now) {
    // day -> (checked at, status) of the latest check that day
    std::map<std::time_t, std::pair<TimeFormatter::Clock::time_point, WebsiteStatus>> latest;

    for (const auto& entry : entries) {
        TimeFormatter::Clock::time_point checked;
        try {
            checked = time.fromString(entry.checkedAt);
        } catch (const std::invalid_argument& e) {
            spdlog::error("Failed to parse check time '{}': {}", entry.checkedAt, e.what());
            continue;
        }

        std::time_t day = localMidnight(TimeFormatter::Clock::to_time_t(checked));
        auto it = latest.find(day);
        if (it == latest.end() || checked > it->second.first) {
            latest[day] = {checked, entry.status};
        }
    }

    std::time_t now_t = TimeFormatter::Clock::to_time_t(now);
    const std::time_t day_cutoff = localMidnight(now_t, -1);
    const std::time_t week_cutoff = localMidnight(now_t, -7);
    const std::time_t month_cutoff = localMidnight(now_t, -30);
    const std::time_t year_cutoff = localMidnight(now_t, -365);

    UptimeSummary summary;
    for (const auto& [day, check] : latest) {
        WebsiteStatus status = check.second;
        if (day >= day_cutoff) tally(summary.day, status);
        if (day >= week_cutoff) tally(summary.week, status);
        if (day >= month_cutoff) tally(summary.month, status);
        if (day >= year_cutoff) tally(summary.year, status);
    }
    return summary;
}

}  // namespace uptime

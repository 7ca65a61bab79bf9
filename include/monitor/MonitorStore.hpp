#pragma once

/**
 * @file MonitorStore.hpp
 * @brief Website, dead check and status history persistence.
 */

#include "Database.hpp"
#include "TimeFormatter.hpp"
#include "Website.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace uptime {

struct StatusEntry {
    WebsiteStatus status = WebsiteStatus::Unknown;
    std::string checkedAt;
};

struct StatusCounts {
    size_t up = 0;
    size_t partiallyUp = 0;
    size_t down = 0;
    size_t unknown = 0;

    size_t total() const { return up + partiallyUp + down + unknown; }
};

// Days counted per window, one status per calendar day
struct UptimeSummary {
    StatusCounts day;
    StatusCounts week;
    StatusCounts month;
    StatusCounts year;
};

/**
 * @class MonitorStore
 * @brief Monitor tables on top of Database.
 *
 * Methods return ErrorHandler statuses. A URL that is not in the websites
 * table yields ERR_NOT_FOUND.
 */
class MonitorStore {
public:
    static constexpr const char* WEBSITES_TABLE = "websites";
    static constexpr const char* DEAD_CHECKS_TABLE = "dead_checks";
    static constexpr const char* STATUS_TABLE = "status_history";
    static constexpr const char* TOUCH_TRIGGER = "websites_touch_last_modified";

    explicit MonitorStore(Database& database);

    // Creates missing tables and the last_modified trigger
    int initialise();

    // Upserts websites by url and replaces their dead checks
    int syncWebsites(const std::vector<Website>& websites);
    int loadWebsites(std::vector<Website>& out);

    int websiteId(const std::string& url, int64_t& out);

    int recordStatus(const std::string& url, WebsiteStatus status);
    int latestStatus(const std::string& url, StatusEntry& out);

    // Newest first; limit 0 returns everything
    int history(const std::string& url, size_t limit, std::vector<StatusEntry>& out);

    int uptimeSummary(const std::string& url, TimeFormatter::Clock::time_point now,
                      UptimeSummary& out);

    /**
     * @brief Keep the latest entry of each local calendar day and count the
     * days that fall within 1, 7, 30 and 365 days of @p now.
     *
     * Entries whose timestamp does not parse are logged and skipped.
     */
    static UptimeSummary summarize(const std::vector<StatusEntry>& entries,
                                   const TimeFormatter& time,
                                   TimeFormatter::Clock::time_point now);

private:
    int replaceDeadChecks(int64_t websiteId, const std::vector<DeadCheck>& checks);
    int loadDeadChecks(int64_t websiteId, std::vector<DeadCheck>& out);

    Database& m_database;
};

}  // namespace uptime

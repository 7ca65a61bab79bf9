#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "MonitorStore.hpp"
#include <filesystem>

using namespace uptime;
using ::testing::Contains;

class MonitorStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "uptime_monitor_test" /
                   ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::filesystem::remove_all(tempDir_);

        DatabaseConfig config;
        config.directory = tempDir_.string();
        config.filename = "monitor.sqlite3";

        db_ = Database::create(config);
        store_ = std::make_unique<MonitorStore>(*db_);
        ASSERT_EQ(store_->initialise(), ErrorHandler::SUCCESS);
    }

    void TearDown() override {
        store_.reset();
        db_.reset();
        std::filesystem::remove_all(tempDir_);
    }

    static Website site(const std::string& name, const std::string& url) {
        Website website;
        website.name = name;
        website.url = url;
        website.channel = 42;
        website.expectedContent = "Welcome";
        return website;
    }

    std::filesystem::path tempDir_;
    std::unique_ptr<Database> db_;
    std::unique_ptr<MonitorStore> store_;
};

// Schema
TEST_F(MonitorStoreTest, InitialiseCreatesTablesAndTrigger) {
    std::vector<std::string> tables;
    ASSERT_EQ(db_->listTables(tables), ErrorHandler::SUCCESS);
    EXPECT_THAT(tables, Contains("websites"));
    EXPECT_THAT(tables, Contains("dead_checks"));
    EXPECT_THAT(tables, Contains("status_history"));

    std::vector<std::string> triggers;
    ASSERT_EQ(db_->listTriggers(triggers), ErrorHandler::SUCCESS);
    EXPECT_THAT(triggers, Contains(MonitorStore::TOUCH_TRIGGER));
}

TEST_F(MonitorStoreTest, InitialiseTwice) {
    EXPECT_EQ(store_->initialise(), ErrorHandler::SUCCESS);

    std::vector<std::string> triggers;
    ASSERT_EQ(db_->listTriggers(triggers), ErrorHandler::SUCCESS);
    EXPECT_EQ(triggers.size(), 1u);
}

// Websites
TEST_F(MonitorStoreTest, SyncAndLoadWebsites) {
    Website example = site("Example", "https://example.org");
    example.expectedStatus = 301;
    example.caseSensitive = true;
    example.deadChecks = {
        {"maintenance", WebsiteStatus::PartiallyUp, false},
        {"Gone", WebsiteStatus::Down, true},
    };
    Website other = site("Other", "https://other.org");

    ASSERT_EQ(store_->syncWebsites({example, other}), ErrorHandler::SUCCESS);

    std::vector<Website> loaded;
    ASSERT_EQ(store_->loadWebsites(loaded), ErrorHandler::SUCCESS);
    ASSERT_EQ(loaded.size(), 2u);

    const Website& first = loaded[0];
    EXPECT_EQ(first.name, "Example");
    EXPECT_EQ(first.url, "https://example.org");
    EXPECT_EQ(first.channel, 42);
    EXPECT_EQ(first.expectedContent, "Welcome");
    EXPECT_EQ(first.expectedStatus, 301);
    EXPECT_TRUE(first.caseSensitive);
    ASSERT_EQ(first.deadChecks.size(), 2u);
    EXPECT_EQ(first.deadChecks[0].keyword, "maintenance");
    EXPECT_EQ(first.deadChecks[0].response, WebsiteStatus::PartiallyUp);
    EXPECT_FALSE(first.deadChecks[0].caseSensitive);
    EXPECT_EQ(first.deadChecks[1].response, WebsiteStatus::Down);
    EXPECT_TRUE(first.deadChecks[1].caseSensitive);

    EXPECT_EQ(loaded[1].name, "Other");
    EXPECT_TRUE(loaded[1].deadChecks.empty());
}

TEST_F(MonitorStoreTest, ResyncUpdatesInPlace) {
    Website example = site("Example", "https://example.org");
    example.deadChecks = {
        {"maintenance", WebsiteStatus::PartiallyUp, false},
        {"error", WebsiteStatus::Down, false},
    };
    ASSERT_EQ(store_->syncWebsites({example}), ErrorHandler::SUCCESS);

    int64_t id_before = 0;
    ASSERT_EQ(store_->websiteId("https://example.org", id_before), ErrorHandler::SUCCESS);

    example.name = "Example renamed";
    example.channel = 7;
    example.deadChecks = {{"offline", WebsiteStatus::Down, false}};
    ASSERT_EQ(store_->syncWebsites({example}), ErrorHandler::SUCCESS);

    int64_t id_after = 0;
    ASSERT_EQ(store_->websiteId("https://example.org", id_after), ErrorHandler::SUCCESS);
    EXPECT_EQ(id_before, id_after);

    std::vector<Website> loaded;
    ASSERT_EQ(store_->loadWebsites(loaded), ErrorHandler::SUCCESS);
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].name, "Example renamed");
    EXPECT_EQ(loaded[0].channel, 7);
    ASSERT_EQ(loaded[0].deadChecks.size(), 1u);
    EXPECT_EQ(loaded[0].deadChecks[0].keyword, "offline");

    int64_t count = 0;
    ASSERT_EQ(db_->countRows("dead_checks", "*", Predicate(), count), ErrorHandler::SUCCESS);
    EXPECT_EQ(count, 1);
}

TEST_F(MonitorStoreTest, SyncEmptyListIsNoOp) {
    EXPECT_EQ(store_->syncWebsites({}), ErrorHandler::SUCCESS);

    std::vector<Website> loaded;
    ASSERT_EQ(store_->loadWebsites(loaded), ErrorHandler::SUCCESS);
    EXPECT_TRUE(loaded.empty());
}

TEST_F(MonitorStoreTest, TimestampsAreFilled) {
    ASSERT_EQ(store_->syncWebsites({site("Example", "https://example.org")}),
              ErrorHandler::SUCCESS);

    std::vector<Row> rows;
    ASSERT_EQ(db_->getRows("websites", {"created_at", "last_modified"}, Predicate(), rows),
              ErrorHandler::SUCCESS);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_NO_THROW(db_->time().fromString(cellToString(rows[0][0])));
    EXPECT_NO_THROW(db_->time().fromString(cellToString(rows[0][1])));
}

TEST_F(MonitorStoreTest, UnknownWebsite) {
    int64_t id = 0;
    EXPECT_EQ(store_->websiteId("https://missing.org", id), ErrorHandler::ERR_NOT_FOUND);
    EXPECT_EQ(store_->recordStatus("https://missing.org", WebsiteStatus::Up),
              ErrorHandler::ERR_NOT_FOUND);

    std::vector<StatusEntry> entries;
    EXPECT_EQ(store_->history("https://missing.org", 0, entries), ErrorHandler::ERR_NOT_FOUND);
}

// Status history
TEST_F(MonitorStoreTest, RecordAndReadHistory) {
    const std::string url = "https://example.org";
    ASSERT_EQ(store_->syncWebsites({site("Example", url)}), ErrorHandler::SUCCESS);

    ASSERT_EQ(store_->recordStatus(url, WebsiteStatus::Up), ErrorHandler::SUCCESS);
    ASSERT_EQ(store_->recordStatus(url, WebsiteStatus::Down), ErrorHandler::SUCCESS);
    ASSERT_EQ(store_->recordStatus(url, WebsiteStatus::PartiallyUp), ErrorHandler::SUCCESS);

    std::vector<StatusEntry> entries;
    ASSERT_EQ(store_->history(url, 0, entries), ErrorHandler::SUCCESS);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].status, WebsiteStatus::PartiallyUp);
    EXPECT_EQ(entries[1].status, WebsiteStatus::Down);
    EXPECT_EQ(entries[2].status, WebsiteStatus::Up);
    EXPECT_NO_THROW(db_->time().fromString(entries[0].checkedAt));

    ASSERT_EQ(store_->history(url, 2, entries), ErrorHandler::SUCCESS);
    EXPECT_EQ(entries.size(), 2u);

    StatusEntry latest;
    ASSERT_EQ(store_->latestStatus(url, latest), ErrorHandler::SUCCESS);
    EXPECT_EQ(latest.status, WebsiteStatus::PartiallyUp);
}

TEST_F(MonitorStoreTest, LatestStatusWithoutHistory) {
    const std::string url = "https://example.org";
    ASSERT_EQ(store_->syncWebsites({site("Example", url)}), ErrorHandler::SUCCESS);

    StatusEntry latest;
    EXPECT_EQ(store_->latestStatus(url, latest), ErrorHandler::ERR_NOT_FOUND);
}

TEST_F(MonitorStoreTest, HistoryIsPerWebsite) {
    ASSERT_EQ(store_->syncWebsites({site("A", "https://a.org"), site("B", "https://b.org")}),
              ErrorHandler::SUCCESS);
    ASSERT_EQ(store_->recordStatus("https://a.org", WebsiteStatus::Down), ErrorHandler::SUCCESS);

    std::vector<StatusEntry> entries;
    ASSERT_EQ(store_->history("https://b.org", 0, entries), ErrorHandler::SUCCESS);
    EXPECT_TRUE(entries.empty());
}

// Uptime summaries
TEST_F(MonitorStoreTest, SummarizeKeepsLatestCheckPerDay) {
    const TimeFormatter& time = db_->time();
    auto now = time.fromString("2026-10-18 12:00:00");

    std::vector<StatusEntry> entries = {
        {WebsiteStatus::Down, "2026-10-18 08:00:00"},
        {WebsiteStatus::Up, "2026-10-18 10:00:00"},
        {WebsiteStatus::PartiallyUp, "2026-10-17 09:00:00"},
        {WebsiteStatus::Down, "2026-10-14 09:00:00"},
        {WebsiteStatus::Down, "2026-09-25 09:00:00"},
        {WebsiteStatus::Up, "2026-01-01 09:00:00"},
        {WebsiteStatus::Up, "2024-01-01 09:00:00"},
        {WebsiteStatus::Down, "not a timestamp"},
    };

    UptimeSummary summary = MonitorStore::summarize(entries, time, now);

    EXPECT_EQ(summary.day.up, 1u);
    EXPECT_EQ(summary.day.partiallyUp, 1u);
    EXPECT_EQ(summary.day.down, 0u);
    EXPECT_EQ(summary.day.total(), 2u);

    EXPECT_EQ(summary.week.down, 1u);
    EXPECT_EQ(summary.week.total(), 3u);

    EXPECT_EQ(summary.month.down, 2u);
    EXPECT_EQ(summary.month.total(), 4u);

    EXPECT_EQ(summary.year.up, 2u);
    EXPECT_EQ(summary.year.total(), 5u);
}

TEST_F(MonitorStoreTest, SummarizeEmpty) {
    UptimeSummary summary = MonitorStore::summarize({}, db_->time(),
                                                    TimeFormatter::Clock::now());

    EXPECT_EQ(summary.year.total(), 0u);
}

TEST_F(MonitorStoreTest, UptimeSummaryFromHistory) {
    const std::string url = "https://example.org";
    ASSERT_EQ(store_->syncWebsites({site("Example", url)}), ErrorHandler::SUCCESS);
    ASSERT_EQ(store_->recordStatus(url, WebsiteStatus::Down), ErrorHandler::SUCCESS);
    ASSERT_EQ(store_->recordStatus(url, WebsiteStatus::Up), ErrorHandler::SUCCESS);

    UptimeSummary summary;
    ASSERT_EQ(store_->uptimeSummary(url, TimeFormatter::Clock::now(), summary),
              ErrorHandler::SUCCESS);

    EXPECT_EQ(summary.day.total(), 1u);
    EXPECT_EQ(summary.day.up, 1u);
    EXPECT_EQ(summary.year.total(), 1u);
}

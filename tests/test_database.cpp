#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Database.hpp"
#include <filesystem>
#include <thread>

using namespace uptime;
using ::testing::ElementsAre;

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "uptime_database_test" /
                   ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::filesystem::remove_all(tempDir_);

        config_.directory = tempDir_.string();
        config_.filename = "facade.sqlite3";
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    std::unique_ptr<Database> openWidgets() {
        auto db = Database::create(config_);
        EXPECT_EQ(db->createTable("widgets", {{"id", "INTEGER PRIMARY KEY"}, {"name", "TEXT"}}),
                  ErrorHandler::SUCCESS);
        return db;
    }

    std::filesystem::path tempDir_;
    DatabaseConfig config_;
};

// Lifecycle tests
TEST_F(DatabaseTest, CreateOpensConnection) {
    auto db = Database::create(config_);

    ASSERT_NE(db, nullptr);
    EXPECT_TRUE(db->isOpen());
    EXPECT_TRUE(db->isAlive());
    EXPECT_TRUE(std::filesystem::exists(tempDir_ / "facade.sqlite3"));
}

TEST_F(DatabaseTest, CreateThrowsWhenFileCannotOpen) {
    config_.directory = "/nonexistent_uptime_dir/deeper";
    config_.create_directory = false;

    EXPECT_THROW(Database::create(config_), DatabaseException);
}

TEST_F(DatabaseTest, CreateAsync) {
    auto future = Database::createAsync(config_);
    auto db = future.get();

    ASSERT_NE(db, nullptr);
    EXPECT_TRUE(db->isOpen());
}

TEST_F(DatabaseTest, CreateAsyncPropagatesFailure) {
    config_.directory = "/nonexistent_uptime_dir/deeper";
    config_.create_directory = false;

    auto future = Database::createAsync(config_);
    EXPECT_THROW(future.get(), DatabaseException);
}

TEST_F(DatabaseTest, CloseIsIdempotent) {
    auto db = Database::create(config_);

    db->close();
    EXPECT_FALSE(db->isOpen());
    EXPECT_FALSE(db->isAlive());
    EXPECT_NO_THROW(db->close());
}

TEST_F(DatabaseTest, OperationsAfterCloseReportNotInitialized) {
    auto db = openWidgets();
    db->close();

    std::vector<std::string> tables;
    std::vector<Row> rows;
    int64_t count = 0;
    EXPECT_EQ(db->listTables(tables), ErrorHandler::ERR_NOT_INITIALIZED);
    EXPECT_EQ(db->insertRow("widgets", makeRow({"1", "a"})), ErrorHandler::ERR_NOT_INITIALIZED);
    EXPECT_EQ(db->getRows("widgets", {"*"}, Predicate(), rows), ErrorHandler::ERR_NOT_INITIALIZED);
    EXPECT_EQ(db->countRows("widgets", "*", Predicate(), count),
              ErrorHandler::ERR_NOT_INITIALIZED);
    EXPECT_EQ(db->upsertRow("widgets", makeRow({"1", "a"})), ErrorHandler::ERR_NOT_INITIALIZED);
    EXPECT_EQ(db->deleteRows("widgets", Predicate()), ErrorHandler::ERR_NOT_INITIALIZED);
}

TEST_F(DatabaseTest, DataSurvivesReopen) {
    {
        auto db = openWidgets();
        ASSERT_EQ(db->insertRow("widgets", makeRow({"1", "gadget"})), ErrorHandler::SUCCESS);
    }

    auto db = Database::create(config_);
    std::vector<Record> records;
    ASSERT_EQ(db->getRows("widgets", {"*"}, Predicate(), records), ErrorHandler::SUCCESS);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(std::get<std::string>(records[0].at("name")), "gadget");
}

// Facade forwarding
TEST_F(DatabaseTest, FullRoundTrip) {
    auto db = openWidgets();

    EXPECT_EQ(db->createTable("widgets", {{"id", "INTEGER PRIMARY KEY"}, {"name", "TEXT"}}),
              ErrorHandler::SUCCESS);
    ASSERT_EQ(db->insertRow("widgets", makeRow({"1", "gadget"})), ErrorHandler::SUCCESS);

    std::vector<Record> records;
    ASSERT_EQ(db->getRows("widgets", {"*"}, Predicate(), records), ErrorHandler::SUCCESS);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(records[0].at("id")), 1);
    EXPECT_EQ(std::get<std::string>(records[0].at("name")), "gadget");

    ASSERT_EQ(db->upsertRow("widgets", makeRow({"1", "gadget-v2"})), ErrorHandler::SUCCESS);
    ASSERT_EQ(db->getRows("widgets", {"*"}, Predicate(), records), ErrorHandler::SUCCESS);
    EXPECT_EQ(std::get<std::string>(records.at(0).at("name")), "gadget-v2");

    EXPECT_TRUE(db->guard().hasSymbolPattern("'; DROP TABLE widgets; --"));
    EXPECT_FALSE(db->guard().hasSymbolPattern("gadget"));

    int64_t count = 0;
    ASSERT_EQ(db->countRows("widgets", "*", "id='1'", count), ErrorHandler::SUCCESS);
    EXPECT_EQ(count, 1);

    std::vector<std::string> columns;
    ASSERT_EQ(db->getColumnNames("widgets", columns), ErrorHandler::SUCCESS);
    EXPECT_THAT(columns, ElementsAre("id", "name"));
}

TEST_F(DatabaseTest, CustomRiskyKeywords) {
    SqlConfig sql;
    sql.risky_keywords = {"Label"};
    auto db = Database::create(config_, sql);

    EXPECT_TRUE(db->sanitizer().isRiskyKeyword("label"));
    EXPECT_FALSE(db->sanitizer().isRiskyKeyword("order"));

    ASSERT_EQ(db->createTable("tags", {{"id", "INTEGER PRIMARY KEY"}, {"label", "TEXT"}}),
              ErrorHandler::SUCCESS);
    ASSERT_EQ(db->insertRow("tags", makeRow({"1", "red"})), ErrorHandler::SUCCESS);

    int64_t count = 0;
    ASSERT_EQ(db->countRows("tags", "label", "label=red", count), ErrorHandler::SUCCESS);
    EXPECT_EQ(count, 1);
}

// Concurrency tests
TEST_F(DatabaseTest, ConcurrentUpsertsAreSerialized) {
    auto db = openWidgets();

    const int thread_count = 4;
    const int rows_per_thread = 25;
    std::vector<std::thread> threads;
    std::vector<int> results(thread_count, ErrorHandler::SUCCESS);

    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < rows_per_thread; ++i) {
                // Every thread writes the same keys
                int rc = db->upsertRow("widgets",
                                       makeRow({std::to_string(i), "thread-" + std::to_string(t)}));
                if (rc != ErrorHandler::SUCCESS) {
                    results[t] = rc;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int rc : results) {
        EXPECT_EQ(rc, ErrorHandler::SUCCESS);
    }

    int64_t count = 0;
    ASSERT_EQ(db->countRows("widgets", "*", Predicate(), count), ErrorHandler::SUCCESS);
    EXPECT_EQ(count, rows_per_thread);
}

TEST_F(DatabaseTest, CloseWhileOperationsRun) {
    auto db = openWidgets();

    std::thread writer([&]() {
        for (int i = 0; i < 50; ++i) {
            int rc = db->insertRow("widgets", makeRow({std::to_string(i), "w"}));
            if (rc == ErrorHandler::ERR_NOT_INITIALIZED) {
                break;
            }
            EXPECT_EQ(rc, ErrorHandler::SUCCESS);
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    db->close();
    writer.join();

    EXPECT_FALSE(db->isOpen());
}

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "StatusEvaluator.hpp"

using namespace uptime;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;

class MockFetcher : public PageFetcher {
public:
    MOCK_METHOD(FetchResult, fetch, (const std::string& url, std::chrono::seconds timeout),
                (override));
};

class StatusEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        site_.name = "Example";
        site_.url = "https://example.org";
        site_.channel = 42;
        site_.expectedContent = "Example Domain";
        site_.expectedStatus = 200;
    }

    static FetchResult response(int status, const std::string& body) {
        FetchResult result;
        result.httpStatus = status;
        result.body = body;
        return result;
    }

    Website site_;
    StatusEvaluator evaluator_;
};

// Base status
TEST_F(StatusEvaluatorTest, ExpectedStatusAndContentIsUp) {
    EXPECT_EQ(evaluator_.evaluate(site_, response(200, "<h1>Example Domain</h1>")),
              WebsiteStatus::Up);
}

TEST_F(StatusEvaluatorTest, MissingContentIsPartiallyUp) {
    EXPECT_EQ(evaluator_.evaluate(site_, response(200, "<h1>Under construction</h1>")),
              WebsiteStatus::PartiallyUp);
}

TEST_F(StatusEvaluatorTest, UnexpectedStatusIsDown) {
    EXPECT_EQ(evaluator_.evaluate(site_, response(503, "Example Domain")), WebsiteStatus::Down);
}

TEST_F(StatusEvaluatorTest, TransportErrorIsDown) {
    FetchResult result;
    result.transportError = true;
    result.error = "connection refused";

    EXPECT_EQ(evaluator_.evaluate(site_, result), WebsiteStatus::Down);
}

TEST_F(StatusEvaluatorTest, TransportErrorSkipsDeadChecks) {
    site_.deadChecks = {{"refused", WebsiteStatus::PartiallyUp, false}};
    FetchResult result;
    result.transportError = true;
    result.body = "refused";

    EXPECT_EQ(evaluator_.evaluate(site_, result), WebsiteStatus::Down);
}

TEST_F(StatusEvaluatorTest, NonDefaultExpectedStatus) {
    site_.expectedStatus = 302;

    EXPECT_EQ(evaluator_.evaluate(site_, response(302, "Example Domain")), WebsiteStatus::Up);
    EXPECT_EQ(evaluator_.evaluate(site_, response(200, "Example Domain")), WebsiteStatus::Down);
}

// Content matching
TEST_F(StatusEvaluatorTest, ContentMatchIgnoresCaseByDefault) {
    EXPECT_EQ(evaluator_.evaluate(site_, response(200, "EXAMPLE DOMAIN")), WebsiteStatus::Up);
}

TEST_F(StatusEvaluatorTest, CaseSensitiveContentMatch) {
    site_.caseSensitive = true;

    EXPECT_EQ(evaluator_.evaluate(site_, response(200, "EXAMPLE DOMAIN")),
              WebsiteStatus::PartiallyUp);
    EXPECT_EQ(evaluator_.evaluate(site_, response(200, "Example Domain")), WebsiteStatus::Up);
}

TEST_F(StatusEvaluatorTest, ContentMatchCollapsesWhitespace) {
    EXPECT_EQ(evaluator_.evaluate(site_, response(200, "<h1>Example\n    Domain</h1>")),
              WebsiteStatus::Up);

    site_.expectedContent = "Example \t Domain";
    EXPECT_EQ(evaluator_.evaluate(site_, response(200, "Example Domain")), WebsiteStatus::Up);
}

TEST_F(StatusEvaluatorTest, NormalizeWhitespace) {
    EXPECT_EQ(StatusEvaluator::normalizeWhitespace("a \n\t b"), "a b");
    EXPECT_EQ(StatusEvaluator::normalizeWhitespace("  a  "), " a ");
    EXPECT_EQ(StatusEvaluator::normalizeWhitespace(""), "");
}

TEST_F(StatusEvaluatorTest, ContainsKeyword) {
    EXPECT_TRUE(StatusEvaluator::containsKeyword("down", "  Site is DOWN  ", false));
    EXPECT_FALSE(StatusEvaluator::containsKeyword("down", "Site is DOWN", true));
    EXPECT_TRUE(StatusEvaluator::containsKeyword("", "anything", false));
    EXPECT_FALSE(StatusEvaluator::containsKeyword("missing", "", false));
}

// Dead checks
TEST_F(StatusEvaluatorTest, DeadCheckOverridesUp) {
    site_.deadChecks = {{"maintenance", WebsiteStatus::PartiallyUp, false}};

    EXPECT_EQ(evaluator_.evaluate(site_, response(200, "Example Domain: Maintenance tonight")),
              WebsiteStatus::PartiallyUp);
}

TEST_F(StatusEvaluatorTest, DeadCheckAppliesAfterStatusMismatch) {
    site_.deadChecks = {{"cached copy", WebsiteStatus::PartiallyUp, false}};

    EXPECT_EQ(evaluator_.evaluate(site_, response(500, "Serving a cached copy")),
              WebsiteStatus::PartiallyUp);
}

TEST_F(StatusEvaluatorTest, FirstMatchingDeadCheckWins) {
    site_.deadChecks = {
        {"absent", WebsiteStatus::Up, false},
        {"error", WebsiteStatus::Down, false},
        {"Example", WebsiteStatus::PartiallyUp, false},
    };

    EXPECT_EQ(evaluator_.evaluate(site_, response(200, "Example Domain error page")),
              WebsiteStatus::Down);
}

TEST_F(StatusEvaluatorTest, CaseSensitiveDeadCheck) {
    site_.deadChecks = {{"Offline", WebsiteStatus::Down, true}};

    EXPECT_EQ(evaluator_.evaluate(site_, response(200, "Example Domain offline")),
              WebsiteStatus::Up);
    EXPECT_EQ(evaluator_.evaluate(site_, response(200, "Example Domain Offline")),
              WebsiteStatus::Down);
}

TEST_F(StatusEvaluatorTest, ApplyDeadChecksFallback) {
    EXPECT_EQ(evaluator_.applyDeadChecks("body", {}, WebsiteStatus::Up), WebsiteStatus::Up);
    EXPECT_EQ(evaluator_.applyDeadChecks("body", {{"nothing", WebsiteStatus::Down, false}},
                                         WebsiteStatus::PartiallyUp),
              WebsiteStatus::PartiallyUp);
}

// Fetchers
TEST_F(StatusEvaluatorTest, CheckUsesFetcher) {
    MockFetcher fetcher;
    EXPECT_CALL(fetcher, fetch("https://example.org", std::chrono::seconds(10)))
        .WillOnce(Return(response(200, "Example Domain")));

    EXPECT_EQ(evaluator_.check(site_, fetcher, 10s), WebsiteStatus::Up);
}

TEST_F(StatusEvaluatorTest, CheckWithRecordedFetcher) {
    RecordedFetcher fetcher(response(404, "Not Found"));

    EXPECT_EQ(evaluator_.check(site_, fetcher, 5s), WebsiteStatus::Down);
    EXPECT_EQ(fetcher.fetch("https://anything", 1s).httpStatus, 404);
}

// Status names
TEST_F(StatusEvaluatorTest, StatusNames) {
    EXPECT_STREQ(statusToString(WebsiteStatus::Up), "Up");
    EXPECT_STREQ(statusToString(WebsiteStatus::PartiallyUp), "Partially Up");
    EXPECT_STREQ(statusToString(WebsiteStatus::Down), "Down");
    EXPECT_STREQ(statusToString(WebsiteStatus::Unknown), "Unknown Status");

    EXPECT_EQ(statusFromString(" partially UP "), WebsiteStatus::PartiallyUp);
    EXPECT_EQ(statusFromString("Unknown"), WebsiteStatus::Unknown);
    EXPECT_EQ(statusFromString("sideways"), std::nullopt);
    EXPECT_EQ(statusFromString("   "), std::nullopt);
}

#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace uptime {

// Outcome of one request against a website
struct FetchResult {
    bool transportError = false;
    int httpStatus = 0;
    std::string body;
    std::string error;
};

/**
 * @class PageFetcher
 * @brief Source of FetchResult values for a URL.
 *
 * The data layer does not perform HTTP itself; the transport lives behind
 * this interface.
 */
class PageFetcher {
public:
    virtual ~PageFetcher() = default;

    virtual FetchResult fetch(const std::string& url, std::chrono::seconds timeout) = 0;
};

// Returns a result captured elsewhere (command line, tests)
class RecordedFetcher : public PageFetcher {
public:
    explicit RecordedFetcher(FetchResult result) : m_result(std::move(result)) {}

    FetchResult fetch(const std::string& url, std::chrono::seconds timeout) override;

private:
    FetchResult m_result;
};

}  // namespace uptime

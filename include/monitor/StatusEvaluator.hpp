#pragma once

#include "PageFetcher.hpp"
#include "Website.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace uptime {

/**
 * @class StatusEvaluator
 * @brief Turns a FetchResult into a WebsiteStatus.
 *
 * - transport failure: Down
 * - status matches and expected content found: Up
 * - status matches, content missing: Partially Up
 * - status differs: Down
 *
 * Dead checks run afterwards on the body in list order; the first keyword
 * found replaces the status with its response.
 */
class StatusEvaluator {
public:
    explicit StatusEvaluator(size_t responseLogSize = 500);

    WebsiteStatus evaluate(const Website& website, const FetchResult& result) const;

    // fetch() through the fetcher, then evaluate()
    WebsiteStatus check(const Website& website, PageFetcher& fetcher,
                        std::chrono::seconds timeout) const;

    WebsiteStatus applyDeadChecks(const std::string& body,
                                  const std::vector<DeadCheck>& checks,
                                  WebsiteStatus fallback) const;

    // Substring match after collapsing whitespace runs to one space
    static bool containsKeyword(const std::string& needle, const std::string& haystack,
                                bool caseSensitive);

    static std::string normalizeWhitespace(const std::string& text);

private:
    size_t m_responseLogSize;
};

}  // namespace uptime

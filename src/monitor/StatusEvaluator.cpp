#include "StatusEvaluator.hpp"
#include <cctype>
#include <spdlog/spdlog.h>

namespace uptime {

namespace {

std::string toLower(const std::string& text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

}  // namespace

StatusEvaluator::StatusEvaluator(size_t responseLogSize)
    : m_responseLogSize(responseLogSize) {}

WebsiteStatus StatusEvaluator::evaluate(const Website& website,
                                        const FetchResult& result) const {
    if (result.transportError) {
        spdlog::warn("Website '{}' is down: {}", website.url,
                     result.error.empty() ? "request failed" : result.error);
        return WebsiteStatus::Down;
    }

    spdlog::debug("First {} characters of the response from '{}': '{}'",
                  m_responseLogSize, website.url, result.body.substr(0, m_responseLogSize));

    WebsiteStatus status = WebsiteStatus::Down;
    if (result.httpStatus == website.expectedStatus) {
        if (containsKeyword(website.expectedContent, result.body, website.caseSensitive)) {
            spdlog::info("Website '{}' is up", website.url);
            status = WebsiteStatus::Up;
        } else {
            spdlog::warn("Website '{}' is partially up", website.url);
            status = WebsiteStatus::PartiallyUp;
        }
    } else {
        spdlog::warn("Website '{}' is down: status {} (expected {})",
                     website.url, result.httpStatus, website.expectedStatus);
    }

    return applyDeadChecks(result.body, website.deadChecks, status);
}

WebsiteStatus StatusEvaluator::check(const Website& website, PageFetcher& fetcher,
                                     std::chrono::seconds timeout) const {
    return evaluate(website, fetcher.fetch(website.url, timeout));
}

WebsiteStatus StatusEvaluator::applyDeadChecks(const std::string& body,
                                               const std::vector<DeadCheck>& checks,
                                               WebsiteStatus fallback) const {
    for (const auto& check : checks) {
        if (containsKeyword(check.keyword, body, check.caseSensitive)) {
            spdlog::debug("Dead check keyword '{}' found, status '{}'",
                          check.keyword, statusToString(check.response));
            return check.response;
        }
    }
    return fallback;
}

// ============================================================================
// Keyword matching
// ============================================================================

std::string StatusEvaluator::normalizeWhitespace(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    bool in_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!in_space) {
                result += ' ';
                in_space = true;
            }
        } else {
            result += c;
            in_space = false;
        }
    }
    return result;
}

bool StatusEvaluator::containsKeyword(const std::string& needle, const std::string& haystack,
                                      bool caseSensitive) {
    std::string n = normalizeWhitespace(needle);
    std::string h = normalizeWhitespace(haystack);

    auto first = h.find_first_not_of(' ');
    h = first == std::string::npos ? std::string() : h.substr(first, h.find_last_not_of(' ') - first + 1);

    if (!caseSensitive) {
        n = toLower(n);
        h = toLower(h);
    }
    return h.find(n) != std::string::npos;
}

}  // namespace uptime

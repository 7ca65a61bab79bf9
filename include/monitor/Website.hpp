#pragma once

/**
 * @file Website.hpp
 * @brief Monitored website definitions and their status values.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace uptime {

enum class WebsiteStatus {
    Up,
    PartiallyUp,
    Down,
    Unknown
};

// "Up", "Partially Up", "Down", "Unknown Status"
const char* statusToString(WebsiteStatus status);

// Case-insensitive inverse of statusToString; also accepts "unknown"
std::optional<WebsiteStatus> statusFromString(const std::string& text);

// A keyword that forces a status when it appears in a response body
struct DeadCheck {
    std::string keyword;
    WebsiteStatus response = WebsiteStatus::Down;
    bool caseSensitive = false;
};

struct Website {
    std::string name;
    std::string url;
    int64_t channel = 0;
    std::string expectedContent;
    int expectedStatus = 200;
    bool caseSensitive = false;
    std::vector<DeadCheck> deadChecks;
};

}  // namespace uptime

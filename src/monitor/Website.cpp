#include "Website.hpp"
#include <cctype>

namespace uptime {

const char* statusToString(WebsiteStatus status) {
    switch (status) {
        case WebsiteStatus::Up:          return "Up";
        case WebsiteStatus::PartiallyUp: return "Partially Up";
        case WebsiteStatus::Down:        return "Down";
        case WebsiteStatus::Unknown:     return "Unknown Status";
    }
    return "Unknown Status";
}

std::optional<WebsiteStatus> statusFromString(const std::string& text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto first = lower.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    lower = lower.substr(first, lower.find_last_not_of(" \t\r\n") - first + 1);

    if (lower == "up") return WebsiteStatus::Up;
    if (lower == "partially up") return WebsiteStatus::PartiallyUp;
    if (lower == "down") return WebsiteStatus::Down;
    if (lower == "unknown status" || lower == "unknown") return WebsiteStatus::Unknown;
    return std::nullopt;
}

}  // namespace uptime

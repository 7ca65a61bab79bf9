#pragma once

/**
 * @file WebsiteCatalog.hpp
 * @brief Loads the list of monitored websites from JSON.
 *
 * The document is either a list of website objects or an object with a
 * "websites" list. Keys are matched case-insensitively:
 *
 * @code
 * [
 *   {
 *     "name": "Example", "url": "https://example.org", "channel": 42,
 *     "expected_content": "Example Domain", "expected_status": 200,
 *     "case_sensitive": false,
 *     "dead_checks": [{"keyword": "maintenance", "response": "partially up"}]
 *   }
 * ]
 * @endcode
 */

#include "Website.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace uptime {

class WebsiteCatalog {
public:
    explicit WebsiteCatalog(bool defaultCaseSensitive = false);

    // Every problem is logged; any invalid entry rejects the whole document
    std::optional<std::vector<Website>> parse(const std::string& text) const;
    std::optional<std::vector<Website>> loadFromFile(const std::filesystem::path& path) const;

private:
    bool parseWebsite(const nlohmann::json& node, size_t index, Website& out) const;
    bool parseDeadChecks(const nlohmann::json& node, const std::string& owner,
                         std::vector<DeadCheck>& out) const;

    // Case-insensitive member lookup, nullptr when absent
    static const nlohmann::json* findKey(const nlohmann::json& object, const std::string& key);

    bool m_defaultCaseSensitive;
};

}  // namespace uptime

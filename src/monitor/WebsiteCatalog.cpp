#include "WebsiteCatalog.hpp"
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <spdlog/spdlog.h>

namespace uptime {

using json = nlohmann::json;

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

WebsiteCatalog::WebsiteCatalog(bool defaultCaseSensitive)
    : m_defaultCaseSensitive(defaultCaseSensitive) {}

std::optional<std::vector<Website>> WebsiteCatalog::parse(const std::string& text) const {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        spdlog::error("Website list is not valid JSON: {}", e.what());
        return std::nullopt;
    }

    const json* list = &document;
    if (document.is_object()) {
        list = findKey(document, "websites");
        if (!list) {
            spdlog::error("Website list object has no 'websites' member");
            return std::nullopt;
        }
    }
    if (!list->is_array()) {
        spdlog::error("Website list must be a JSON array, got {}", list->type_name());
        return std::nullopt;
    }

    std::vector<Website> websites;
    std::set<std::string> urls;
    bool valid = true;

    for (size_t i = 0; i < list->size(); ++i) {
        Website website;
        if (!parseWebsite((*list)[i], i, website)) {
            valid = false;
            continue;
        }
        if (!urls.insert(website.url).second) {
            spdlog::error("Website {} ('{}'): url '{}' is listed more than once",
                          i, website.name, website.url);
            valid = false;
            continue;
        }
        websites.push_back(std::move(website));
    }

    if (!valid) {
        spdlog::error("Website list rejected: at least one entry is corrupted");
        return std::nullopt;
    }

    spdlog::info("Loaded {} website(s)", websites.size());
    return websites;
}

std::optional<std::vector<Website>> WebsiteCatalog::loadFromFile(
    const std::filesystem::path& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("Cannot open website list {}", path.string());
        return std::nullopt;
    }

    std::ostringstream content;
    content << file.rdbuf();
    return parse(content.str());
}

// ============================================================================
// Entry validation
// ============================================================================

bool WebsiteCatalog::parseWebsite(const json& node, size_t index, Website& out) const {
    if (!node.is_object()) {
        spdlog::error("Website {}: expected an object, got {}", index, node.type_name());
        return false;
    }

    bool valid = true;
    auto requireString = [&](const char* key, std::string& target) {
        const json* value = findKey(node, key);
        if (!value) {
            spdlog::error("Website {}: missing '{}'", index, key);
            valid = false;
        } else if (!value->is_string()) {
            spdlog::error("Website {}: '{}' must be a string", index, key);
            valid = false;
        } else {
            target = value->get<std::string>();
        }
    };
    auto requireInteger = [&](const char* key, int64_t& target) {
        const json* value = findKey(node, key);
        if (!value) {
            spdlog::error("Website {}: missing '{}'", index, key);
            valid = false;
        } else if (!value->is_number_integer()) {
            spdlog::error("Website {}: '{}' must be an integer", index, key);
            valid = false;
        } else {
            target = value->get<int64_t>();
        }
    };

    requireString("name", out.name);
    requireString("url", out.url);
    requireInteger("channel", out.channel);
    requireString("expected_content", out.expectedContent);

    int64_t expected_status = 0;
    requireInteger("expected_status", expected_status);
    out.expectedStatus = static_cast<int>(expected_status);

    out.caseSensitive = m_defaultCaseSensitive;
    if (const json* value = findKey(node, "case_sensitive")) {
        if (!value->is_boolean()) {
            spdlog::error("Website {}: 'case_sensitive' must be a boolean", index);
            valid = false;
        } else {
            out.caseSensitive = value->get<bool>();
        }
    }

    if (valid && out.url.empty()) {
        spdlog::error("Website {}: 'url' is empty", index);
        valid = false;
    }

    if (const json* checks = findKey(node, "dead_checks")) {
        if (!parseDeadChecks(*checks, out.name, out.deadChecks)) {
            valid = false;
        }
    }
    return valid;
}

bool WebsiteCatalog::parseDeadChecks(const json& node, const std::string& owner,
                                     std::vector<DeadCheck>& out) const {
    if (node.is_null()) {
        return true;
    }
    if (!node.is_array()) {
        spdlog::error("Website '{}': 'dead_checks' must be a list", owner);
        return false;
    }

    bool valid = true;
    for (size_t i = 0; i < node.size(); ++i) {
        const json& item = node[i];
        if (!item.is_object()) {
            spdlog::error("Website '{}': dead check {} must be an object", owner, i);
            valid = false;
            continue;
        }
        if (item.empty()) {
            spdlog::warn("Website '{}': dead check {} is empty, skipping", owner, i);
            continue;
        }

        DeadCheck check;
        check.caseSensitive = m_defaultCaseSensitive;

        const json* keyword = findKey(item, "keyword");
        if (!keyword || !keyword->is_string()) {
            spdlog::error("Website '{}': dead check {} needs a string 'keyword'", owner, i);
            valid = false;
        } else {
            check.keyword = keyword->get<std::string>();
        }

        const json* response = findKey(item, "response");
        if (!response || !response->is_string()) {
            spdlog::error("Website '{}': dead check {} needs a string 'response'", owner, i);
            valid = false;
        } else {
            auto status = statusFromString(response->get<std::string>());
            if (!status || *status == WebsiteStatus::Unknown) {
                spdlog::error("Website '{}': dead check {} has unknown response '{}'",
                              owner, i, response->get<std::string>());
                valid = false;
            } else {
                check.response = *status;
            }
        }

        if (const json* sensitive = findKey(item, "case_sensitive")) {
            if (!sensitive->is_boolean()) {
                spdlog::error("Website '{}': dead check {} 'case_sensitive' must be a boolean",
                              owner, i);
                valid = false;
            } else {
                check.caseSensitive = sensitive->get<bool>();
            }
        }

        if (valid) {
            out.push_back(std::move(check));
        }
    }
    return valid;
}

const json* WebsiteCatalog::findKey(const json& object, const std::string& key) {
    if (!object.is_object()) {
        return nullptr;
    }
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (equalsIgnoreCase(it.key(), key)) {
            return &it.value();
        }
    }
    return nullptr;
}

}  // namespace uptime

#include "PageFetcher.hpp"
#include <spdlog/spdlog.h>

namespace uptime {

FetchResult RecordedFetcher::fetch(const std::string& url, std::chrono::seconds timeout) {
    spdlog::debug("Recorded fetch for '{}' (timeout {}s): status {}, {} byte body{}",
                  url, timeout.count(), m_result.httpStatus, m_result.body.size(),
                  m_result.transportError ? ", transport error" : "");
    return m_result;
}

}  // namespace uptime

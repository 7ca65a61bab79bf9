#include "TimeFormatter.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace uptime {

TimeFormatter::TimeFormatter(std::string datetimeFormat, std::string dateFormat)
    : m_datetimeFormat(std::move(datetimeFormat))
    , m_dateFormat(std::move(dateFormat)) {
}

std::string TimeFormatter::toString(Clock::time_point tp, bool dateOnly,
                                    bool sqlMode) const {
    std::time_t t = Clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream out;
    out << std::put_time(&local, dateOnly ? m_dateFormat.c_str() : m_datetimeFormat.c_str());

    if (sqlMode && !dateOnly) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch()) % 1000;
        out << '.' << std::setw(3) << std::setfill('0') << ms.count();
    }
    return out.str();
}

TimeFormatter::Clock::time_point TimeFormatter::fromString(const std::string& text,
                                                           bool dateOnly) const {
    std::tm local{};
    std::istringstream in(text);
    in >> std::get_time(&local, dateOnly ? m_dateFormat.c_str() : m_datetimeFormat.c_str());
    if (in.fail()) {
        throw std::invalid_argument("Invalid timestamp: '" + text + "'");
    }

    // Optional milliseconds written in sql mode
    int millis = 0;
    if (!dateOnly && in.peek() == '.') {
        in.get();
        std::string digits;
        while (std::isdigit(in.peek())) {
            digits += static_cast<char>(in.get());
        }
        if (digits.empty() || digits.size() > 3) {
            throw std::invalid_argument("Invalid fractional seconds in '" + text + "'");
        }
        while (digits.size() < 3) digits += '0';
        millis = std::stoi(digits);
    }

    in >> std::ws;
    if (!in.eof()) {
        throw std::invalid_argument("Trailing characters in timestamp: '" + text + "'");
    }

    local.tm_isdst = -1;
    std::time_t t = std::mktime(&local);
    if (t == static_cast<std::time_t>(-1)) {
        throw std::invalid_argument("Timestamp out of range: '" + text + "'");
    }
    return Clock::from_time_t(t) + std::chrono::milliseconds(millis);
}

std::string TimeFormatter::nowValue() const {
    return toString(Clock::now());
}

std::string TimeFormatter::currentDateValue() const {
    return toString(Clock::now(), true);
}

}  // namespace uptime

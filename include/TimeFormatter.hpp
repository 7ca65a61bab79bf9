#pragma once

#include <chrono>
#include <string>

namespace uptime {

// Formats and parses the local timestamps stored in the database
class TimeFormatter {
public:
    using Clock = std::chrono::system_clock;

    static constexpr const char* DEFAULT_DATETIME_FORMAT = "%Y-%m-%d %H:%M:%S";
    static constexpr const char* DEFAULT_DATE_FORMAT = "%Y-%m-%d";

    explicit TimeFormatter(std::string datetimeFormat = DEFAULT_DATETIME_FORMAT,
                           std::string dateFormat = DEFAULT_DATE_FORMAT);

    // sqlMode appends milliseconds (".mmm") to datetime output
    std::string toString(Clock::time_point tp, bool dateOnly = false,
                         bool sqlMode = false) const;

    // Throws std::invalid_argument when text does not match the format
    Clock::time_point fromString(const std::string& text, bool dateOnly = false) const;

    std::string nowValue() const;
    std::string currentDateValue() const;

    const std::string& datetimeFormat() const { return m_datetimeFormat; }
    const std::string& dateFormat() const { return m_dateFormat; }

private:
    std::string m_datetimeFormat;
    std::string m_dateFormat;
};

}  // namespace uptime

#pragma once
#include <chrono>
#include <string>

// Local-time helpers shared by the ledger, exports and tests.
// Stored format: "YYYY-MM-DD HH:MM:SS".
namespace TimeUtils {

    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    std::string format_timestamp(TimePoint tp);   // 2025-03-04 09:15:00
    std::string format_date(TimePoint tp);        // 2025-03-04
    std::string format_time(TimePoint tp);        // 09:15:00

    // Strict parse of the stored format; false on any malformed input.
    bool parse_timestamp(const std::string& text, TimePoint& out);

    // Builds a local-time instant (month 1-12).
    TimePoint make_local(int year, int month, int day,
                         int hour = 0, int minute = 0, int second = 0);

    TimePoint start_of_day(TimePoint tp);
    TimePoint start_of_week(TimePoint tp);    // Monday 00:00
    TimePoint start_of_month(TimePoint tp);   // 1st 00:00
}

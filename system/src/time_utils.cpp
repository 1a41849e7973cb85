// ============= src/time_utils.cpp =============
#include "time_utils.hpp"
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace TimeUtils {

namespace {

std::tm to_local_tm(TimePoint tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

std::string format(TimePoint tp, const char* fmt) {
    std::tm tm = to_local_tm(tp);
    std::stringstream ss;
    ss << std::put_time(&tm, fmt);
    return ss.str();
}

TimePoint from_local_tm(std::tm tm) {
    tm.tm_isdst = -1;
    return Clock::from_time_t(std::mktime(&tm));
}

} // namespace

std::string format_timestamp(TimePoint tp) {
    return format(tp, "%Y-%m-%d %H:%M:%S");
}

std::string format_date(TimePoint tp) {
    return format(tp, "%Y-%m-%d");
}

std::string format_time(TimePoint tp) {
    return format(tp, "%H:%M:%S");
}

bool parse_timestamp(const std::string& text, TimePoint& out) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    int consumed = 0;

    if (text.size() != 19) return false;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d %2d:%2d:%2d%n",
                    &y, &mo, &d, &h, &mi, &s, &consumed) != 6) {
        return false;
    }
    if (consumed != static_cast<int>(text.size())) return false;
    if (mo < 1 || mo > 12 || d < 1 || d > 31 ||
        h < 0 || h > 23 || mi < 0 || mi > 59 || s < 0 || s > 59) {
        return false;
    }

    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = s;
    tm.tm_isdst = -1;

    std::tm probe = tm;
    if (std::mktime(&probe) == static_cast<std::time_t>(-1)) return false;
    // mktime normalizes impossible dates (e.g. 02-31); reject those.
    if (probe.tm_mday != d || probe.tm_mon != mo - 1) return false;

    out = from_local_tm(tm);
    return true;
}

TimePoint make_local(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return from_local_tm(tm);
}

TimePoint start_of_day(TimePoint tp) {
    std::tm tm = to_local_tm(tp);
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    return from_local_tm(tm);
}

TimePoint start_of_week(TimePoint tp) {
    std::tm tm = to_local_tm(tp);
    int days_since_monday = (tm.tm_wday + 6) % 7;
    tm.tm_mday -= days_since_monday;
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    return from_local_tm(tm);
}

TimePoint start_of_month(TimePoint tp) {
    std::tm tm = to_local_tm(tp);
    tm.tm_mday = 1;
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    return from_local_tm(tm);
}

} // namespace TimeUtils

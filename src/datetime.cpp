#include "datetime.hpp"

#include <cstdio>

namespace exif_redate {

namespace {

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

int ToInt(const std::string& s, std::size_t pos, std::size_t len) {
    int v = 0;
    for (std::size_t i = pos; i < pos + len; ++i) v = v * 10 + (s[i] - '0');
    return v;
}

}  // namespace

bool operator==(const DateTime& a, const DateTime& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day &&
           a.hour == b.hour && a.minute == b.minute && a.second == b.second;
}

std::ostream& operator<<(std::ostream& os, const DateTime& dt) {
    return os << FormatExifDateTime(dt);
}

bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && IsLeapYear(year)) return 29;
    return kDays[month - 1];
}

bool IsValidDateTime(const DateTime& dt) {
    if (dt.year < 1 || dt.year > 9999) return false;
    if (dt.month < 1 || dt.month > 12) return false;
    if (dt.day < 1 || dt.day > DaysInMonth(dt.year, dt.month)) return false;
    if (dt.hour < 0 || dt.hour > 23) return false;
    if (dt.minute < 0 || dt.minute > 59) return false;
    return dt.second >= 0 && dt.second <= 59;
}

std::optional<DateTime> ParseExifDateTime(const std::string& text) {
    std::string s = text;
    while (!s.empty() && (s.back() == '\0' || s.back() == ' ')) s.pop_back();

    // "YYYY:MM:DD HH:MM:SS" => 19 chars
    if (s.size() != 19) return std::nullopt;
    for (int i : {0, 1, 2, 3, 5, 6, 8, 9, 11, 12, 14, 15, 17, 18}) {
        if (!IsDigit(s[static_cast<std::size_t>(i)])) return std::nullopt;
    }
    if (s[4] != ':' || s[7] != ':' || s[10] != ' ' || s[13] != ':' || s[16] != ':') {
        return std::nullopt;
    }

    DateTime dt;
    dt.year = ToInt(s, 0, 4);
    dt.month = ToInt(s, 5, 2);
    dt.day = ToInt(s, 8, 2);
    dt.hour = ToInt(s, 11, 2);
    dt.minute = ToInt(s, 14, 2);
    dt.second = ToInt(s, 17, 2);
    if (!IsValidDateTime(dt)) return std::nullopt;
    return dt;
}

std::string FormatExifDateTime(const DateTime& dt) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d:%02d:%02d %02d:%02d:%02d",
                  dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second);
    return buf;
}

std::time_t ToTimeT(const DateTime& dt) {
    std::tm tm{};
    tm.tm_year = dt.year - 1900;
    tm.tm_mon = dt.month - 1;
    tm.tm_mday = dt.day;
    tm.tm_hour = dt.hour;
    tm.tm_min = dt.minute;
    tm.tm_sec = dt.second;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

DateTime FromTimeT(std::time_t t) {
    std::tm lt{};
#ifdef _WIN32
    localtime_s(&lt, &t);
#else
    localtime_r(&t, &lt);
#endif
    DateTime dt;
    dt.year = lt.tm_year + 1900;
    dt.month = lt.tm_mon + 1;
    dt.day = lt.tm_mday;
    dt.hour = lt.tm_hour;
    dt.minute = lt.tm_min;
    dt.second = lt.tm_sec;
    return dt;
}

}  // namespace exif_redate

#pragma once

#include <ctime>
#include <optional>
#include <ostream>
#include <string>

namespace exif_redate {

// Naive local calendar time, second precision.
struct DateTime {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

bool operator==(const DateTime& a, const DateTime& b);
std::ostream& operator<<(std::ostream& os, const DateTime& dt);

bool IsLeapYear(int year);
int DaysInMonth(int year, int month);

// True when every field is inside its calendar range.
bool IsValidDateTime(const DateTime& dt);

// "YYYY:MM:DD HH:MM:SS". Trailing NULs/spaces are tolerated since
// some writers pad the ASCII field.
std::optional<DateTime> ParseExifDateTime(const std::string& text);
std::string FormatExifDateTime(const DateTime& dt);

// Local time conversions (mktime/localtime), matching how file
// timestamps are displayed on the machine running the tool.
std::time_t ToTimeT(const DateTime& dt);
DateTime FromTimeT(std::time_t t);

}  // namespace exif_redate

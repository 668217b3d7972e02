#pragma once

#include "datetime.hpp"

#include <optional>

namespace exif_redate {

constexpr int kMinYear = 1900;
constexpr int kMaxYear = 2100;

// Replaces the year (and optionally the month) of a timestamp while
// keeping day and time of day.
struct DateSubstitution {
    int year = kMinYear;
    std::optional<int> month;

    // Throws InvalidArgumentError when year or month is out of range.
    void validate() const;

    // Throws InvalidDateError when the source day does not exist in the
    // target month, e.g. Feb 29 moved to a non-leap year. No clamping.
    DateTime apply(const DateTime& source) const;
};

}  // namespace exif_redate

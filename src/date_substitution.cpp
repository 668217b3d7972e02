#include "date_substitution.hpp"

#include "errors.hpp"

#include <string>

namespace exif_redate {

void DateSubstitution::validate() const {
    if (year < kMinYear || year > kMaxYear) {
        throw InvalidArgumentError("year " + std::to_string(year) + " is outside " +
                                   std::to_string(kMinYear) + ".." + std::to_string(kMaxYear));
    }
    if (month && (*month < 1 || *month > 12)) {
        throw InvalidArgumentError("month " + std::to_string(*month) + " is outside 1..12");
    }
}

DateTime DateSubstitution::apply(const DateTime& source) const {
    DateTime result = source;
    result.year = year;
    if (month) result.month = *month;

    if (result.day > DaysInMonth(result.year, result.month)) {
        throw InvalidDateError("day " + std::to_string(result.day) + " does not exist in " +
                               std::to_string(result.year) + "-" + std::to_string(result.month));
    }
    return result;
}

}  // namespace exif_redate

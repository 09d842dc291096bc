#include "BarUnit.hpp"

std::string_view BarUnit::unitAbbreviation(std::string_view unit) {
    namespace layout = candlewick::layout;

    if (unit == "second" || unit == layout::kSecond) return "sec";
    if (unit == "minute" || unit == layout::kMinute) return "min";
    if (unit == "hour"   || unit == layout::kHour)   return "hrs";
    if (unit == "day"    || unit == layout::kDay)    return "day";
    if (unit == "month"  || unit == layout::kMonth)  return "mon";
    if (unit == "year"   || unit == layout::kYear)   return "yr";
    return "";
}

std::string BarUnit::axisLabel() const {
    return "Time [" + std::to_string(count) + " " + abbreviation() + "]";
}

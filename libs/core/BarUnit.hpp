#pragma once
#include <string>
#include <string_view>

/**
 * BarUnit - time span covered by one candle, used only for axis label text.
 *
 * The unit is kept as the caller supplied it; unitAbbreviation() maps the six
 * supported granularities (by name or by their date layout, e.g.
 * "2006-01-02T15:04" for minutes) to a short display form and anything else
 * to an empty string.
 */
struct BarUnit {
    int count = 1;
    std::string unit = "minute";

    std::string abbreviation() const { return std::string(unitAbbreviation(unit)); }

    // "Time [5 min]"
    std::string axisLabel() const;

    static std::string_view unitAbbreviation(std::string_view unit);
};

namespace candlewick::layout {
    // Date layouts that identify a granularity in addition to its name
    inline constexpr std::string_view kSecond = "2006-01-02T15:04:05";
    inline constexpr std::string_view kMinute = "2006-01-02T15:04";
    inline constexpr std::string_view kHour   = "2006-01-02T15";
    inline constexpr std::string_view kDay    = "2006-01-02";
    inline constexpr std::string_view kMonth  = "2006-01";
    inline constexpr std::string_view kYear   = "2006";
}

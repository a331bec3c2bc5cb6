// File: TimeClassifier.hpp
// Description: Declares the clock-time parser and the period and lateness
//              window tables used to classify meeting and join times.

#pragma once

#include "backend/Attendance.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace backend {

// Closed interval [lowerBound, upperBound] in seconds since midnight.
struct TimeWindow {
    int lowerBound;
    int upperBound;
    const char* label;

    bool contains(int seconds) const noexcept {
        return seconds >= lowerBound && seconds <= upperBound;
    }
};

inline constexpr std::size_t kPeriodCount = 8;

// Adjacent windows overlap; evaluated in ascending order, first match wins.
inline constexpr std::array<TimeWindow, kPeriodCount> kPeriodWindows{{
    {27800, 35100, "Period 1"},
    {33900, 41100, "Period 2"},
    {39900, 47100, "Period 3"},
    {46700, 53300, "Period 4"},
    {53100, 60300, "Period 5"},
    {59100, 66300, "Period 6"},
    {65100, 72300, "Period 7"},
    {70700, 77900, "Period 8"},
}};

// Late-join windows, one per period, sharing their upper bound with it.
inline constexpr std::array<TimeWindow, kPeriodCount> kLatenessWindows{{
    {29000, 35100, "Period 1"},
    {35100, 41100, "Period 2"},
    {41100, 47100, "Period 3"},
    {47900, 53300, "Period 4"},
    {54300, 60300, "Period 5"},
    {60300, 66300, "Period 6"},
    {66300, 72300, "Period 7"},
    {71900, 77900, "Period 8"},
}};

struct DateTimeField {
    std::string date;
    std::string time;
};

// Three tokens are hours, minutes, seconds; two tokens are minutes, seconds.
// Throws FatalInputError for any other count or a non-numeric token.
int parseClockTime(const std::vector<std::string>& tokens);
int parseClockTime(const std::string& text);

// Splits "date, time" on commas: the first part is the date, the second the
// time with its spaces removed.
DateTimeField splitDateTime(const std::string& field);

class TimeIntervalClassifier {
public:
    std::string classifySlot(int seconds) const;
    Lateness classifyLateness(int seconds) const;

    // Index of the lateness window holding the time. A shared boundary point
    // belongs to the later window.
    std::optional<std::size_t> latenessWindow(int seconds) const;
    std::optional<std::size_t> periodWindow(int seconds) const;
};

}  // namespace backend

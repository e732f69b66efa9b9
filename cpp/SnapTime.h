#pragma once

#include <ctime>
#include <optional>
#include <ostream>
#include <string>

namespace snapsorter {

// Calendar timestamp with one-second resolution, no time zone attached.
struct SnapTime {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;

    bool sameDate(const SnapTime& other) const;

    // "YYYY-MM-DD HH:MM:SS"
    std::string toString() const;
};

bool operator==(const SnapTime& a, const SnapTime& b);
bool operator!=(const SnapTime& a, const SnapTime& b);
std::ostream& operator<<(std::ostream& os, const SnapTime& t);

// Components of a timestamp as found by a source; absent fields were not matched.
struct SnapFields {
    std::optional<int> year;
    std::optional<int> month;
    std::optional<int> day;
    std::optional<int> hour;
    std::optional<int> minute;
    std::optional<int> second;
};

bool isValidDate(int year, int month, int day);
bool isValidTime(int hour, int minute, int second);

// Year, month and day are required; hour/minute/second default to 0.
// Returns nullopt when a required field is missing or any field is out of range.
std::optional<SnapTime> makeSnapTime(const SnapFields& fields);

// EXIF DateTime format "YYYY:MM:DD HH:MM:SS"
std::optional<SnapTime> parseExifDateTime(const std::string& text);

// ISO-like "YYYY-MM-DDTHH:MM:SS" (no fraction, no zone suffix)
std::optional<SnapTime> parseIsoDateTime(const std::string& text);

// time_t -> local calendar time
std::optional<SnapTime> snapTimeFromTimestamp(std::time_t timestamp);

}  // namespace snapsorter

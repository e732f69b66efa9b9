#include "SnapTime.h"
#include <iomanip>
#include <sstream>

namespace snapsorter {

namespace {

std::string trimTimeString(const std::string& s) {
    const char* blanks = " \t\r\n";
    std::string t = s;
    // EXIF ASCII values are NUL terminated; Exiv2 may hand the terminator back.
    while (!t.empty() && t.back() == '\0') t.pop_back();
    size_t first = t.find_first_not_of(blanks);
    if (first == std::string::npos) return "";
    size_t last = t.find_last_not_of(blanks);
    return t.substr(first, last - first + 1);
}

// Parse with std::get_time and require the whole input to be consumed.
std::optional<SnapTime> parseWithFormat(const std::string& text, const char* format) {
    std::string input = trimTimeString(text);
    if (input.empty()) return std::nullopt;
    std::tm tm = {};
    std::istringstream ss(input);
    ss >> std::get_time(&tm, format);
    if (ss.fail()) return std::nullopt;
    if (ss.peek() != std::char_traits<char>::eof()) return std::nullopt;

    SnapFields fields;
    fields.year = tm.tm_year + 1900;
    fields.month = tm.tm_mon + 1;
    fields.day = tm.tm_mday;
    fields.hour = tm.tm_hour;
    fields.minute = tm.tm_min;
    fields.second = tm.tm_sec;
    return makeSnapTime(fields);
}

}  // namespace

bool SnapTime::sameDate(const SnapTime& other) const {
    return year == other.year && month == other.month && day == other.day;
}

std::string SnapTime::toString() const {
    std::ostringstream ss;
    ss << *this;
    return ss.str();
}

bool operator==(const SnapTime& a, const SnapTime& b) {
    return a.sameDate(b) && a.hour == b.hour && a.minute == b.minute && a.second == b.second;
}

bool operator!=(const SnapTime& a, const SnapTime& b) {
    return !(a == b);
}

std::ostream& operator<<(std::ostream& os, const SnapTime& t) {
    const char fill = os.fill('0');
    os << std::setw(4) << t.year << "-" << std::setw(2) << t.month << "-" << std::setw(2) << t.day
       << " " << std::setw(2) << t.hour << ":" << std::setw(2) << t.minute << ":" << std::setw(2) << t.second;
    os.fill(fill);
    return os;
}

bool isValidDate(int year, int month, int day) {
    if (year < 1 || year > 9999) return false;
    if (month < 1 || month > 12) return false;
    int daysInMonth[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (month == 2 && (year % 400 == 0 || (year % 100 != 0 && year % 4 == 0)))
        daysInMonth[1] = 29;
    return day >= 1 && day <= daysInMonth[month - 1];
}

bool isValidTime(int hour, int minute, int second) {
    return (hour >= 0 && hour < 24) && (minute >= 0 && minute < 60) && (second >= 0 && second < 60);
}

std::optional<SnapTime> makeSnapTime(const SnapFields& fields) {
    if (!fields.year || !fields.month || !fields.day) return std::nullopt;
    SnapTime t;
    t.year = *fields.year;
    t.month = *fields.month;
    t.day = *fields.day;
    t.hour = fields.hour.value_or(0);
    t.minute = fields.minute.value_or(0);
    t.second = fields.second.value_or(0);
    if (!isValidDate(t.year, t.month, t.day) || !isValidTime(t.hour, t.minute, t.second))
        return std::nullopt;
    return t;
}

std::optional<SnapTime> parseExifDateTime(const std::string& text) {
    return parseWithFormat(text, "%Y:%m:%d %H:%M:%S");
}

std::optional<SnapTime> parseIsoDateTime(const std::string& text) {
    return parseWithFormat(text, "%Y-%m-%dT%H:%M:%S");
}

std::optional<SnapTime> snapTimeFromTimestamp(std::time_t timestamp) {
    std::tm tm = {};
#ifdef _WIN32
    if (localtime_s(&tm, &timestamp) != 0) return std::nullopt;
#else
    if (localtime_r(&timestamp, &tm) == nullptr) return std::nullopt;
#endif
    SnapFields fields;
    fields.year = tm.tm_year + 1900;
    fields.month = tm.tm_mon + 1;
    fields.day = tm.tm_mday;
    fields.hour = tm.tm_hour;
    fields.minute = tm.tm_min;
    // Leap seconds are folded into the last regular second.
    fields.second = tm.tm_sec > 59 ? 59 : tm.tm_sec;
    return makeSnapTime(fields);
}

}  // namespace snapsorter

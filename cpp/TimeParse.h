#pragma once

#include "SnapTime.h"
#include "TimestampSource.h"
#include <array>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace snapsorter {

class RunLog;

// Filename pattern with optional named groups (?<year>..), (?<month>..),
// (?<day>..), (?<hour>..), (?<minute>..), (?<second>..).
// std::regex has no named groups, so names are stripped at compile time
// and mapped to their group numbers.
class FilenamePattern {
public:
    // Returns nullopt and sets error for an invalid regex, an unknown
    // group name or a name used twice.
    static std::optional<FilenamePattern> compile(const std::string& source, std::string& error);

    // Search filename; on a match fill only the fields whose group took part.
    // A matched group that is not a number leaves the field empty and sets malformed.
    bool match(const std::string& filename, SnapFields& fields, bool& malformed) const;

    const std::string& source() const { return m_source; }

private:
    FilenamePattern() = default;

    std::string m_source;
    std::regex m_regex;
    std::array<int, 6> m_groups{};  // year..second -> group number, 0 = not in pattern
};

// Built-in patterns, most specific first.
const std::vector<std::string>& defaultFilenamePatterns();

// Compile in order. On the first bad pattern returns false with error naming it.
bool compileFilenamePatterns(const std::vector<std::string>& sources,
                             std::vector<FilenamePattern>& patterns, std::string& error);

// First pattern that matches wins, even if the date it yields is invalid.
std::optional<SnapTime> parseFileNameTime(const std::string& filename,
                                          const std::vector<FilenamePattern>& patterns, RunLog& log);

class FilenameSource : public TimestampSource {
public:
    explicit FilenameSource(std::vector<FilenamePattern> patterns);

    const char* name() const override { return "filename"; }
    Evidence lookup(const MediaItem& item, RunLog& log) override;

private:
    std::vector<FilenamePattern> m_patterns;
};

}  // namespace snapsorter

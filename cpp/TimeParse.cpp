#include "TimeParse.h"
#include "RunLog.h"
#include <charconv>
#include <utility>

namespace snapsorter {

namespace {

const char* const kFieldNames[] = { "year", "month", "day", "hour", "minute", "second" };

int fieldIndex(const std::string& name) {
    for (int i = 0; i < 6; ++i) {
        if (name == kFieldNames[i]) return i;
    }
    return -1;
}

}  // namespace

std::optional<FilenamePattern> FilenamePattern::compile(const std::string& source, std::string& error) {
    FilenamePattern pattern;
    pattern.m_source = source;

    std::string plain;
    int groupCount = 0;
    bool inClass = false;
    for (size_t i = 0; i < source.size(); ++i) {
        char c = source[i];
        if (c == '\\') {
            plain += c;
            if (i + 1 < source.size()) plain += source[++i];
            continue;
        }
        if (inClass) {
            if (c == ']') inClass = false;
            plain += c;
            continue;
        }
        if (c == '[') {
            inClass = true;
            plain += c;
            continue;
        }
        if (c == '(') {
            if (i + 1 < source.size() && source[i + 1] == '?') {
                // (?<name>...) is a named capture; (?<= and (?<! would be lookbehind.
                bool named = i + 3 < source.size() && source[i + 2] == '<'
                    && source[i + 3] != '=' && source[i + 3] != '!';
                if (!named) {
                    plain += c;
                    continue;
                }
                size_t close = source.find('>', i + 3);
                if (close == std::string::npos) {
                    error = "unterminated group name in pattern: " + source;
                    return std::nullopt;
                }
                std::string name = source.substr(i + 3, close - i - 3);
                int field = fieldIndex(name);
                if (field < 0) {
                    error = "unknown group name '" + name + "' in pattern: " + source;
                    return std::nullopt;
                }
                ++groupCount;
                if (pattern.m_groups[field] != 0) {
                    error = "group '" + name + "' used twice in pattern: " + source;
                    return std::nullopt;
                }
                pattern.m_groups[field] = groupCount;
                plain += '(';
                i = close;
                continue;
            }
            ++groupCount;
        }
        plain += c;
    }
    if (inClass) {
        error = "unterminated character class in pattern: " + source;
        return std::nullopt;
    }

    try {
        pattern.m_regex = std::regex(plain, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        error = "invalid pattern '" + source + "': " + e.what();
        return std::nullopt;
    }
    return pattern;
}

bool FilenamePattern::match(const std::string& filename, SnapFields& fields, bool& malformed) const {
    malformed = false;
    std::smatch m;
    if (!std::regex_search(filename, m, m_regex)) return false;

    std::optional<int>* targets[] = {
        &fields.year, &fields.month, &fields.day, &fields.hour, &fields.minute, &fields.second
    };
    for (size_t f = 0; f < m_groups.size(); ++f) {
        int g = m_groups[f];
        if (g == 0 || !m[g].matched || m[g].length() == 0) continue;
        const std::string text = m[g].str();
        int value = 0;
        auto res = std::from_chars(text.data(), text.data() + text.size(), value);
        if (res.ec != std::errc() || res.ptr != text.data() + text.size()) {
            malformed = true;
            continue;
        }
        *targets[f] = value;
    }
    return true;
}

const std::vector<std::string>& defaultFilenamePatterns() {
    static const std::vector<std::string> patterns = {
        // Our own output: 2024-3-5-14h30m45s_IMG1.jpg
        R"((?<year>\d{4})-(?<month>\d{1,2})-(?<day>\d{1,2})-(?<hour>\d{1,2})h(?<minute>\d{1,2})(?:m(?<second>\d{1,2})s)?_(?:IMG|VID)\d+)",
        // IMG_20231111_193849.jpg, VID_20210801-171003.mp4
        R"((?<year>\d{4})(?<month>\d{2})(?<day>\d{2})[_-](?<hour>\d{2})(?<minute>\d{2})(?<second>\d{2}))",
        // Screenshot_2021-03-25-01-12-43.png, 2020-07-14 18.02.33.jpg
        R"((?<year>\d{4})-(?<month>\d{2})-(?<day>\d{2})[ _-](?<hour>\d{2})[.:-](?<minute>\d{2})(?:[.:-](?<second>\d{2}))?)",
        // pt2021_10_23_21_52_39.jpg
        R"(pt(?<year>\d{4})_(?<month>\d{2})_(?<day>\d{2})_(?<hour>\d{2})_(?<minute>\d{2})_(?<second>\d{2}))",
        R"((?<year>\d{4})-(?<month>\d{2})-(?<day>\d{2}))",
        R"((?<year>(?:19|20)\d{2})(?<month>\d{2})(?<day>\d{2}))",
    };
    return patterns;
}

bool compileFilenamePatterns(const std::vector<std::string>& sources,
                             std::vector<FilenamePattern>& patterns, std::string& error) {
    patterns.clear();
    patterns.reserve(sources.size());
    for (const auto& source : sources) {
        std::optional<FilenamePattern> p = FilenamePattern::compile(source, error);
        if (!p) return false;
        patterns.push_back(std::move(*p));
    }
    return true;
}

std::optional<SnapTime> parseFileNameTime(const std::string& filename,
                                          const std::vector<FilenamePattern>& patterns, RunLog& log) {
    for (const auto& pattern : patterns) {
        SnapFields fields;
        bool malformed = false;
        if (!pattern.match(filename, fields, malformed)) continue;

        std::optional<SnapTime> t;
        if (!malformed) t = makeSnapTime(fields);
        if (!t) {
            log.warn(filename + ": matched pattern " + pattern.source() + " but not a valid date, ignoring");
            return std::nullopt;
        }
        log.debug(filename + ": matched pattern " + pattern.source());
        return t;
    }
    log.debug(filename + ": no filename pattern matched");
    return std::nullopt;
}

FilenameSource::FilenameSource(std::vector<FilenamePattern> patterns) : m_patterns(std::move(patterns)) {}

Evidence FilenameSource::lookup(const MediaItem& item, RunLog& log) {
    return parseFileNameTime(item.path.filename().string(), m_patterns, log);
}

}  // namespace snapsorter

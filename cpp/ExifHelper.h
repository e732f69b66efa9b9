#pragma once

#include "TimestampSource.h"
#include <exiv2/exiv2.hpp>
#include <optional>
#include <string>
#include <vector>

namespace snapsorter {

class RunLog;

// Tags holding a capture time, in the order they are consulted.
const std::vector<std::string>& exifTimeTags();

// Read EXIF block; on failure returns false and fills error with the Exiv2 message.
bool getExifData(const std::string& filepath, Exiv2::ExifData& exifData, std::string& error);

// First present time tag of exifData as raw text (usually "YYYY:MM:DD HH:MM:SS").
std::optional<std::string> findExifTime(const Exiv2::ExifData& exifData);

// Image capture time from EXIF. The first Exiv2 failure per instance is a
// warning, later ones are debug output so a broken library does not flood the log.
class ExifSource : public TimestampSource {
public:
    const char* name() const override { return "exif"; }
    Evidence lookup(const MediaItem& item, RunLog& log) override;

private:
    bool m_failureReported = false;
};

}  // namespace snapsorter

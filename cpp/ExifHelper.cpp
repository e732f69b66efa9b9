#include "ExifHelper.h"
#include "RunLog.h"
#include <exception>

namespace snapsorter {

const std::vector<std::string>& exifTimeTags() {
    static const std::vector<std::string> tags = {
        "Exif.Image.DateTime",
        "Exif.Photo.DateTimeOriginal",
        "Exif.Photo.DateTimeDigitized",
    };
    return tags;
}

bool getExifData(const std::string& filepath, Exiv2::ExifData& exifData, std::string& error) {
    try {
        auto image = Exiv2::ImageFactory::open(filepath);
        if (!image.get()) {
            error = "unable to open file";
            return false;
        }
        image->readMetadata();
        exifData = image->exifData();
        return true;
    } catch (const Exiv2::Error& e) {
        error = e.what();
        return false;
    } catch (const std::exception& e) {
        // Corrupt files also raise std::overflow_error and std::bad_alloc.
        error = e.what();
        return false;
    }
}

std::optional<std::string> findExifTime(const Exiv2::ExifData& exifData) {
    for (const auto& tag : exifTimeTags()) {
        auto pos = exifData.findKey(Exiv2::ExifKey(tag));
        if (pos != exifData.end())
            return pos->toString();
    }
    return std::nullopt;
}

Evidence ExifSource::lookup(const MediaItem& item, RunLog& log) {
    const std::string fileName = item.path.filename().string();
    Exiv2::ExifData exifData;
    std::string error;
    if (!getExifData(item.path.string(), exifData, error)) {
        std::string msg = fileName + ": Exiv2 could not read metadata (" + error + ")";
        if (!m_failureReported) {
            log.warn(msg);
            m_failureReported = true;
        } else {
            log.debug(msg);
        }
        return std::nullopt;
    }
    if (exifData.empty()) {
        log.debug(fileName + ": no EXIF data");
        return std::nullopt;
    }

    std::optional<std::string> raw = findExifTime(exifData);
    if (!raw) {
        log.debug(fileName + ": no EXIF time tags");
        return std::nullopt;
    }
    Evidence t = parseExifDateTime(*raw);
    if (!t) {
        log.warn(fileName + ": invalid date found in EXIF data (" + *raw + "), ignoring");
        return std::nullopt;
    }
    return t;
}

}  // namespace snapsorter

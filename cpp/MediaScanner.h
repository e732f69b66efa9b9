#pragma once

#include "MediaItem.h"
#include <cstddef>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

namespace snapsorter {

class RunLog;

// Lazy recursive walk that yields supported media files one at a time.
// Unreadable directories are reported and skipped; the excluded directory
// (the destination, when it lies inside the source) is not descended into.
class MediaScanner {
public:
    MediaScanner(const fs::path& root, RunLog& log, const fs::path& exclude = fs::path());

    std::optional<MediaItem> next();

    std::size_t filesSeen() const { return m_filesSeen; }
    std::size_t skippedFiles() const { return m_skipped; }

private:
    void advance();

    RunLog& m_log;
    fs::path m_exclude;
    fs::recursive_directory_iterator m_it;
    bool m_started = false;
    std::size_t m_filesSeen = 0;
    std::size_t m_skipped = 0;
};

}  // namespace snapsorter

#include "MediaScanner.h"
#include "RunLog.h"
#include <system_error>

namespace snapsorter {

namespace {

// Opened up front so a failure skips one directory instead of ending the walk.
bool isReadableDirectory(const fs::path& dir, std::error_code& ec) {
    ec.clear();
    fs::directory_iterator it(dir, ec);
    return !ec;
}

}  // namespace

MediaScanner::MediaScanner(const fs::path& root, RunLog& log, const fs::path& exclude) : m_log(log) {
    std::error_code ec;
    if (!exclude.empty()) {
        m_exclude = fs::weakly_canonical(exclude, ec);
        if (ec) m_exclude = exclude.lexically_normal();
        ec.clear();
    }
    m_it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        m_log.error("Cannot read directory " + root.string() + ": " + ec.message());
        m_it = fs::recursive_directory_iterator();
    }
}

void MediaScanner::advance() {
    std::error_code ec;
    m_it.increment(ec);
    if (ec) {
        m_log.error("Directory traversal stopped: " + ec.message());
        m_it = fs::recursive_directory_iterator();
    }
}

std::optional<MediaItem> MediaScanner::next() {
    const fs::recursive_directory_iterator end;
    if (m_started && m_it != end) advance();
    m_started = true;

    while (m_it != end) {
        const fs::directory_entry& entry = *m_it;
        std::error_code ec;
        if (entry.is_directory(ec)) {
            if (!m_exclude.empty() && fs::weakly_canonical(entry.path(), ec) == m_exclude) {
                m_log.debug("Skipping destination directory " + entry.path().string());
                m_it.disable_recursion_pending();
            } else if (!isReadableDirectory(entry.path(), ec)) {
                m_log.warn("Cannot read directory " + entry.path().string() + ": " + ec.message() + ", skipping");
                m_it.disable_recursion_pending();
            } else {
                m_log.debug("---- Directory: " + entry.path().string() + " ----");
            }
            advance();
            continue;
        }
        if (!entry.is_regular_file(ec)) {
            advance();
            continue;
        }
        ++m_filesSeen;
        if (!isMediaFile(entry.path())) {
            ++m_skipped;
            m_log.debug("Non-media file: " + entry.path().string());
            advance();
            continue;
        }
        return makeMediaItem(entry.path());
    }
    return std::nullopt;
}

}  // namespace snapsorter

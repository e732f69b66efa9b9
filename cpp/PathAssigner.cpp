#include "PathAssigner.h"
#include <sstream>
#include <utility>

namespace snapsorter {

std::string canonicalFileName(const MediaItem& item, const SnapTime& time, int counter) {
    std::ostringstream ss;
    ss << time.year << "-" << time.month << "-" << time.day << "-" << time.hour << "h" << time.minute;
    if (time.second != 0) ss << "m" << time.second << "s";
    ss << "_" << (item.kind == MediaKind::Video ? "VID" : "IMG") << counter;
    ss << "." << item.extension;
    return ss.str();
}

fs::path canonicalOutputPath(const MediaItem& item, const SnapTime& time, int counter) {
    return fs::path(std::to_string(time.year)) / std::to_string(time.month) / canonicalFileName(item, time, counter);
}

fs::path PathAssigner::assign(const MediaItem& item, const SnapTime& time) {
    // Terminates: the set is finite and each counter value yields a distinct path.
    int counter = 1;
    fs::path candidate = canonicalOutputPath(item, time, counter);
    while (isUsed(candidate)) {
        ++counter;
        candidate = canonicalOutputPath(item, time, counter);
    }
    m_usedPaths.insert(candidate.generic_string());
    return candidate;
}

bool PathAssigner::isUsed(const fs::path& relativePath) const {
    return m_usedPaths.count(relativePath.generic_string()) != 0;
}

AssignmentStream::AssignmentStream(Producer producer) : m_producer(std::move(producer)) {}

std::optional<Assignment> AssignmentStream::next() {
    if (m_exhausted || !m_producer) return std::nullopt;
    std::optional<DatedMedia> dated = m_producer();
    if (!dated) {
        m_exhausted = true;
        return std::nullopt;
    }
    Assignment a;
    a.source = dated->item.path;
    a.output = m_assigner.assign(dated->item, dated->time);
    return a;
}

}  // namespace snapsorter

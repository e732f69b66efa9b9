#pragma once

#include "MediaItem.h"
#include "SnapTime.h"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>

namespace fs = std::filesystem;

namespace snapsorter {

// "<Y>-<M>-<D>-<h>h<m>[m<s>s]_<IMG|VID><counter>.<ext>", fields unpadded,
// seconds only when non-zero.
std::string canonicalFileName(const MediaItem& item, const SnapTime& time, int counter);

// "<Y>/<M>/" + canonicalFileName
fs::path canonicalOutputPath(const MediaItem& item, const SnapTime& time, int counter);

// Hands out relative output paths, never the same one twice. The used-path
// set only grows, so results depend on the order of calls: not thread safe
// and not meant to be shared between runs.
class PathAssigner {
public:
    fs::path assign(const MediaItem& item, const SnapTime& time);

    bool isUsed(const fs::path& relativePath) const;
    std::size_t size() const { return m_usedPaths.size(); }

private:
    std::unordered_set<std::string> m_usedPaths;  // generic_string() of each assigned path
};

struct DatedMedia {
    MediaItem item;
    SnapTime time;
};

struct Assignment {
    fs::path source;
    fs::path output;  // relative to the destination directory
};

// Pull-based, single pass: each next() pulls one DatedMedia from the
// producer and assigns it. Once the producer is exhausted next() keeps
// returning nullopt.
class AssignmentStream {
public:
    using Producer = std::function<std::optional<DatedMedia>()>;

    explicit AssignmentStream(Producer producer);

    std::optional<Assignment> next();

private:
    Producer m_producer;
    PathAssigner m_assigner;
    bool m_exhausted = false;
};

}  // namespace snapsorter

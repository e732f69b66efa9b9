#pragma once

#include "TimestampSource.h"
#include <optional>
#include <string>

namespace snapsorter {

/// Run a shell command, capture stdout. Returns false if the command could
/// not be started or exited non-zero.
bool runCommand(const std::string& command, std::string& output);

/// Quote a path for the shell.
std::string quotePath(const std::string& path);

enum class ProbeStatus {
    Ok,
    ProbeFailed,  // ffprobe missing, crashed or rejected the file
    NoTag
};

/// Get the first stream's creation_time tag via ffprobe, raw
/// (e.g. "2023-10-23T12:00:00.000000Z"). Empty optional unless status is Ok.
std::optional<std::string> getVideoCreationTime(const std::string& ffprobe, const std::string& filePath,
                                                ProbeStatus& status);

/// Drop the fractional-second suffix (and a bare trailing 'Z') and surrounding whitespace.
std::string normalizeCreationTime(const std::string& raw);

// Video creation time from container metadata.
class VideoProbeSource : public TimestampSource {
public:
    explicit VideoProbeSource(std::string ffprobe = "ffprobe");

    const char* name() const override { return "video-metadata"; }
    Evidence lookup(const MediaItem& item, RunLog& log) override;

private:
    std::string m_ffprobe;
    bool m_failureReported = false;
};

}  // namespace snapsorter

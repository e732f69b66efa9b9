#pragma once

#include "TimestampSource.h"
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace snapsorter {

// Last modification time of the file as local calendar time.
std::optional<SnapTime> getFileModificationTime(const fs::path& filepath);

// Last resort when neither metadata nor filename could date a file.
// Linux has no portable creation time, so this is the mtime.
class FileTimeSource : public TimestampSource {
public:
    const char* name() const override { return "file-time"; }
    Evidence lookup(const MediaItem& item, RunLog& log) override;
};

enum class TransferMode {
    Move,
    Copy,
    DryRun
};

const char* transferModeName(TransferMode mode);

// True when both paths name the same existing file, e.g. an item that is
// already at its sorted location.
bool isSameFile(const fs::path& a, const fs::path& b);

// Move or copy source to target, creating target's directories.
// Never overwrites: an existing target is an error. DryRun only checks.
bool transferFile(const fs::path& source, const fs::path& target, TransferMode mode, std::string& error);

}  // namespace snapsorter

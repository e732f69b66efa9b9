#include "FileTimeHelper.h"
#include "RunLog.h"
#include <sys/stat.h>
#include <system_error>

namespace snapsorter {

std::optional<SnapTime> getFileModificationTime(const fs::path& filepath) {
    struct stat fileStat;
    if (stat(filepath.string().c_str(), &fileStat) != 0) return std::nullopt;
    return snapTimeFromTimestamp(fileStat.st_mtime);
}

Evidence FileTimeSource::lookup(const MediaItem& item, RunLog& log) {
    Evidence t = getFileModificationTime(item.path);
    if (!t) log.debug(item.path.filename().string() + ": cannot stat file");
    return t;
}

const char* transferModeName(TransferMode mode) {
    switch (mode) {
        case TransferMode::Move: return "move";
        case TransferMode::Copy: return "copy";
        case TransferMode::DryRun: return "dry-run";
        default: return "?";
    }
}

bool isSameFile(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    bool same = fs::equivalent(a, b, ec);
    return !ec && same;
}

bool transferFile(const fs::path& source, const fs::path& target, TransferMode mode, std::string& error) {
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        error = "File not exist: " + source.string();
        return false;
    }
    if (fs::exists(target, ec)) {
        error = "Target file already exists: " + target.string();
        return false;
    }
    if (mode == TransferMode::DryRun) return true;

    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            error = "Cannot create directory " + target.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    if (mode == TransferMode::Move) {
        fs::rename(source, target, ec);
        if (!ec) return true;
        if (ec != std::errc::cross_device_link) {
            error = "Move failed: " + ec.message();
            return false;
        }
        ec.clear();
    }

    // Copy, or a move across file systems.
    fs::copy_file(source, target, fs::copy_options::none, ec);
    if (ec) {
        error = "Copy failed: " + ec.message();
        return false;
    }
    if (mode == TransferMode::Move) {
        fs::remove(source, ec);
        if (ec) {
            error = "Copied but could not remove source: " + ec.message();
            return false;
        }
    }
    return true;
}

}  // namespace snapsorter

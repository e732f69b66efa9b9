#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace snapsorter {

enum class MediaKind {
    Image,
    Video,
    Unsupported
};

const char* mediaKindName(MediaKind kind);

struct MediaItem {
    fs::path path;
    MediaKind kind = MediaKind::Unsupported;
    std::string extension;  // canonical, without the dot
};

/// Lowercased extension without the dot; "jpeg" -> "jpg", "tiff" -> "tif".
std::string canonicalExtension(const fs::path& filePath);

bool isImageFile(const fs::path& filePath);
bool isVideoFile(const fs::path& filePath);
/// True if file is an image or video we can sort.
bool isMediaFile(const fs::path& filePath);

MediaKind mediaKindOf(const fs::path& filePath);

/// Describe a file; kind is Unsupported when the extension is not in either set.
MediaItem makeMediaItem(const fs::path& filePath);

}  // namespace snapsorter

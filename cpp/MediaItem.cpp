#include "MediaItem.h"
#include <algorithm>
#include <cctype>
#include <vector>

namespace snapsorter {

static std::string lowerExtension(const fs::path& filePath) {
    std::string ext = filePath.extension().string();
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

static bool hasExtension(const fs::path& filePath, const std::vector<std::string>& extensions) {
    std::string ext = lowerExtension(filePath);
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

const char* mediaKindName(MediaKind kind) {
    switch (kind) {
        case MediaKind::Image: return "image";
        case MediaKind::Video: return "video";
        case MediaKind::Unsupported: return "unsupported";
        default: return "?";
    }
}

std::string canonicalExtension(const fs::path& filePath) {
    std::string ext = lowerExtension(filePath);
    if (ext == "jpeg") return "jpg";
    if (ext == "tiff") return "tif";
    return ext;
}

bool isImageFile(const fs::path& filePath) {
    static const std::vector<std::string> imageExtensions = {
        "jpg", "jpeg", "png", "bmp", "gif", "tif", "tiff", "webp", "heic", "raw"
    };
    return hasExtension(filePath, imageExtensions);
}

bool isVideoFile(const fs::path& filePath) {
    static const std::vector<std::string> videoExtensions = {
        "mp4", "mov", "avi", "mkv", "m4v", "webm", "wmv", "3gp"
    };
    return hasExtension(filePath, videoExtensions);
}

bool isMediaFile(const fs::path& filePath) {
    return isImageFile(filePath) || isVideoFile(filePath);
}

MediaKind mediaKindOf(const fs::path& filePath) {
    if (isImageFile(filePath)) return MediaKind::Image;
    if (isVideoFile(filePath)) return MediaKind::Video;
    return MediaKind::Unsupported;
}

MediaItem makeMediaItem(const fs::path& filePath) {
    MediaItem item;
    item.path = filePath;
    item.kind = mediaKindOf(filePath);
    item.extension = canonicalExtension(filePath);
    return item;
}

}  // namespace snapsorter

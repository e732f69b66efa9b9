#include "TimestampSource.h"
#include "RunLog.h"

namespace snapsorter {

MetadataSource::MetadataSource(std::unique_ptr<TimestampSource> imageSource,
                               std::unique_ptr<TimestampSource> videoSource)
    : m_imageSource(std::move(imageSource)), m_videoSource(std::move(videoSource)) {}

Evidence MetadataSource::lookup(const MediaItem& item, RunLog& log) {
    switch (item.kind) {
        case MediaKind::Image:
            if (m_imageSource) return m_imageSource->lookup(item, log);
            break;
        case MediaKind::Video:
            if (m_videoSource) return m_videoSource->lookup(item, log);
            break;
        case MediaKind::Unsupported:
            log.debug(item.path.filename().string() + ": unsupported extension, no metadata source");
            return std::nullopt;
    }
    log.debug(item.path.filename().string() + ": no " + mediaKindName(item.kind) + " metadata source configured");
    return std::nullopt;
}

}  // namespace snapsorter

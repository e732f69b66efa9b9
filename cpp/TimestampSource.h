#pragma once

#include "MediaItem.h"
#include "SnapTime.h"
#include <memory>
#include <optional>

namespace snapsorter {

class RunLog;

// A source either found a timestamp or found nothing usable.
using Evidence = std::optional<SnapTime>;

// One independent way of dating a media file. lookup() never throws:
// read/probe/decode failures become an empty Evidence, and a value that
// does not parse as a timestamp is reported as a warning first.
class TimestampSource {
public:
    virtual ~TimestampSource() = default;
    virtual const char* name() const = 0;
    virtual Evidence lookup(const MediaItem& item, RunLog& log) = 0;
};

// Embedded metadata: EXIF for images, container tags for videos.
// Exactly one of the two is asked, chosen by the item's kind.
class MetadataSource : public TimestampSource {
public:
    MetadataSource(std::unique_ptr<TimestampSource> imageSource,
                   std::unique_ptr<TimestampSource> videoSource);

    const char* name() const override { return "metadata"; }
    Evidence lookup(const MediaItem& item, RunLog& log) override;

private:
    std::unique_ptr<TimestampSource> m_imageSource;
    std::unique_ptr<TimestampSource> m_videoSource;
};

}  // namespace snapsorter

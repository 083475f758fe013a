#pragma once
// MediaElementFactory.hpp - Creates playable elements for a MediaSource

#include <memory>
#include "MediaElement.hpp"
#include "MediaSource.hpp"

namespace rs {

class MediaElementFactory {
public:
    virtual ~MediaElementFactory() = default;

    // Returns an unloaded element; the caller owns it
    virtual std::unique_ptr<MediaElement> create(const MediaSource& source,
                                                 AudioFormat format) = 0;
};

class FFmpegMediaElementFactory : public MediaElementFactory {
public:
    std::unique_ptr<MediaElement> create(const MediaSource& source,
                                         AudioFormat format) override;
};

} // namespace rs

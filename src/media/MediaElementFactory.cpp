#include "MediaElementFactory.hpp"
#include "FFmpegMediaElement.hpp"

namespace rs {

std::unique_ptr<MediaElement> FFmpegMediaElementFactory::create(
        const MediaSource& source,
        AudioFormat format) {
    return std::make_unique<FFmpegMediaElement>(source, format);
}

} // namespace rs

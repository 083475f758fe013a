#include "SegmentPlan.hpp"
#include <algorithm>

namespace rs {

SegmentPlan::SegmentPlan(usize index,
                         MediaAssetHandle* speech,
                         MediaAssetHandle* normalized,
                         MediaAssetHandle* video,
                         f64 audioDuration,
                         f64 videoDuration)
    : index_(index),
      speech_(speech),
      normalized_(normalized),
      video_(video),
      audioDuration_(audioDuration),
      videoDuration_(videoDuration),
      duration_(std::max(audioDuration, video ? videoDuration : 0.0)) {
}

Result<SegmentPlan> SegmentPlan::build(usize index,
                                       MediaAssetHandle& speech,
                                       MediaAssetHandle* normalized,
                                       MediaAssetHandle* video) {
    auto unloaded = [index](const MediaAssetHandle& h) {
        Error e(ErrorCode::Programming, "Segment planned before its media was loaded");
        e.atSegment(index).forAsset(h.describe());
        return Result<SegmentPlan>::err(std::move(e));
    };

    if (!speech.duration()) {
        return unloaded(speech);
    }
    if (normalized && !normalized->duration()) {
        return unloaded(*normalized);
    }
    if (video && !video->duration()) {
        return unloaded(*video);
    }

    MediaAssetHandle& effective = normalized ? *normalized : speech;
    return Result<SegmentPlan>::ok(SegmentPlan(index,
                                               &speech,
                                               normalized,
                                               video,
                                               *effective.duration(),
                                               video ? *video->duration() : 0.0));
}

} // namespace rs

#pragma once
// SegmentPlan.hpp - Immutable per-segment playback plan for one export
// Built once after the normalization pass; the effective audio choice and
// the derived durations cannot change afterwards.

#include "media/MediaAssetHandle.hpp"
#include "util/Result.hpp"

namespace rs {

class SegmentPlan {
public:
    // All given handles must be loaded. normalized and video may be null.
    static Result<SegmentPlan> build(usize index,
                                     MediaAssetHandle& speech,
                                     MediaAssetHandle* normalized,
                                     MediaAssetHandle* video);

    usize index() const {
        return index_;
    }
    MediaAssetHandle& speech() const {
        return *speech_;
    }
    MediaAssetHandle* normalized() const {
        return normalized_;
    }
    MediaAssetHandle* video() const {
        return video_;
    }
    bool hasVisual() const {
        return video_ != nullptr;
    }

    // Normalized audio when present, otherwise the speech audio
    MediaAssetHandle& effectiveAudio() const {
        return normalized_ ? *normalized_ : *speech_;
    }

    f64 audioDuration() const {
        return audioDuration_;
    }
    f64 videoDuration() const {
        return videoDuration_;
    }
    // max(effective audio, video if shown)
    f64 duration() const {
        return duration_;
    }

private:
    SegmentPlan(usize index,
                MediaAssetHandle* speech,
                MediaAssetHandle* normalized,
                MediaAssetHandle* video,
                f64 audioDuration,
                f64 videoDuration);

    const usize index_;
    MediaAssetHandle* const speech_;
    MediaAssetHandle* const normalized_;
    MediaAssetHandle* const video_;
    const f64 audioDuration_;
    const f64 videoDuration_;
    const f64 duration_;
};

} // namespace rs

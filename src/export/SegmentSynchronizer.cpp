#include "SegmentSynchronizer.hpp"
#include <algorithm>
#include "core/Logger.hpp"

namespace rs {

namespace {
const QImage kNoFrame;
} // namespace

const char* syncStateName(SyncState state) {
    switch (state) {
    case SyncState::Idle:
        return "idle";
    case SyncState::Priming:
        return "priming";
    case SyncState::Playing:
        return "playing";
    case SyncState::Completing:
        return "completing";
    case SyncState::Done:
        return "done";
    }
    return "idle";
}

SegmentSynchronizer::SegmentSynchronizer(const SegmentPlan& plan,
                                         AudioGraph& graph,
                                         SyncPolicy policy)
    : plan_(plan), graph_(graph), policy_(policy) {
}

SegmentSynchronizer::~SegmentSynchronizer() {
    if (state_ != SyncState::Idle) {
        finish();
    }
}

Result<void> SegmentSynchronizer::prime() {
    if (state_ != SyncState::Idle) {
        return Result<void>::err(ErrorCode::Programming,
                                 std::string("prime() in state ") + syncStateName(state_));
    }
    state_ = SyncState::Priming;

    MediaAssetHandle& audio = plan_.effectiveAudio();
    MediaAssetHandle* video = plan_.video();

    audio.element().pause();
    if (auto r = audio.element().rewind(); !r) {
        return failPriming(r.error());
    }
    if (video) {
        video->element().pause();
        if (auto r = video->element().rewind(); !r) {
            return failPriming(r.error());
        }
    }

    if (plan_.normalized()) {
        audible_ = plan_.normalized();
    } else if (video && video->element().hasAudio() && policy_.videoAudioReplacesSpeech) {
        audible_ = video;
    } else {
        audible_ = &plan_.speech();
    }

    audio.element().setMuted(audible_ != &audio);
    if (video) {
        video->element().setMuted(audible_ != video);
    }

    auto node = graph_.createSource(*audible_);
    if (!node) {
        return failPriming(node.error());
    }
    node_ = *node;
    if (auto r = node_->connect(); !r) {
        return failPriming(r.error());
    }

    audioDone_ = false;
    videoDone_ = video == nullptr;
    audioEnded_.emplace(audio.element().endReached,
                        audio.element().endReached.connect([this] { setAudioDone(); }));
    if (video) {
        videoEnded_.emplace(video->element().endReached,
                            video->element().endReached.connect([this] { setVideoDone(); }));
    }

    LOG_DEBUG("Segment {} primed: audible={}", plan_.index() + 1, audible_->describe());
    return Result<void>::ok();
}

Result<void> SegmentSynchronizer::failPriming(Error error) {
    error.atSegment(plan_.index());
    finish();
    return Result<void>::err(std::move(error));
}

Result<void> SegmentSynchronizer::start() {
    if (state_ != SyncState::Priming) {
        return Result<void>::err(ErrorCode::Programming,
                                 std::string("start() in state ") + syncStateName(state_));
    }
    state_ = SyncState::Playing;
    plan_.effectiveAudio().element().play();
    if (auto* video = plan_.video()) {
        video->element().play();
    }
    return Result<void>::ok();
}

Result<void> SegmentSynchronizer::advance(f64 dt) {
    if (state_ != SyncState::Playing && state_ != SyncState::Completing) {
        return Result<void>::ok();
    }

    // A latched clock keeps playing out its tail until the segment is Done;
    // elements stop by themselves at their end
    if (auto r = plan_.effectiveAudio().element().advance(dt); !r) {
        Error e = r.error();
        e.atSegment(plan_.index());
        return Result<void>::err(std::move(e));
    }
    if (auto* video = plan_.video()) {
        if (auto r = video->element().advance(dt); !r) {
            Error e = r.error();
            e.atSegment(plan_.index());
            return Result<void>::err(std::move(e));
        }
    }
    return Result<void>::ok();
}

bool SegmentSynchronizer::reached(const MediaAssetHandle& handle, f64 tolerance) {
    const MediaElement& el = handle.element();
    if (el.ended()) {
        return true;
    }
    const f64 duration = handle.duration().value_or(0.0);
    return el.currentTime() >= std::max(0.0, duration - tolerance);
}

void SegmentSynchronizer::evaluate() {
    if (state_ != SyncState::Playing && state_ != SyncState::Completing) {
        return;
    }

    if (!audioDone_ && reached(plan_.effectiveAudio(), policy_.completionTolerance)) {
        setAudioDone();
    }
    if (!videoDone_ && plan_.video() && reached(*plan_.video(), policy_.completionTolerance)) {
        setVideoDone();
    }
    checkCompletion();
}

void SegmentSynchronizer::setAudioDone() {
    if (audioDone_) {
        return;
    }
    audioDone_ = true;
    LOG_TRACE("Segment {} audio clock done", plan_.index() + 1);
    if (state_ == SyncState::Playing) {
        state_ = SyncState::Completing;
    }
}

void SegmentSynchronizer::setVideoDone() {
    if (videoDone_) {
        return;
    }
    videoDone_ = true;
    LOG_TRACE("Segment {} video clock done", plan_.index() + 1);
    if (state_ == SyncState::Playing) {
        state_ = SyncState::Completing;
    }
}

void SegmentSynchronizer::checkCompletion() {
    if (audioDone_ && videoDone_) {
        finish();
    }
}

void SegmentSynchronizer::finish() {
    if (state_ == SyncState::Done) {
        return;
    }
    if (state_ != SyncState::Idle && !(audioDone_ && videoDone_)) {
        LOG_WARN("Segment {} stopped before both clocks finished", plan_.index() + 1);
    }

    audioEnded_.reset();
    videoEnded_.reset();

    MediaAssetHandle& audio = plan_.effectiveAudio();
    audio.element().pause();
    audio.element().setMuted(false);
    if (auto* video = plan_.video()) {
        video->element().pause();
        video->element().setMuted(false);
    }
    if (node_) {
        node_->disconnect();
    }

    state_ = SyncState::Done;
}

bool SegmentSynchronizer::showVideo() const {
    return plan_.video() && !videoDone_ &&
           (state_ == SyncState::Playing || state_ == SyncState::Completing);
}

const QImage& SegmentSynchronizer::videoFrame() const {
    if (!plan_.video()) {
        return kNoFrame;
    }
    return plan_.video()->element().currentFrame();
}

} // namespace rs

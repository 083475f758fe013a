/**
 * @file SegmentSynchronizer.hpp
 * @brief Dual-clock playback state machine for one segment.
 *
 *   Idle -> Priming -> Playing -> Completing -> Done
 *
 * prime() pauses and rewinds the segment's elements, picks the single
 * audible source (normalized audio, else the video's own audio when policy
 * allows, else the speech audio), mutes everything else and connects the
 * audible element to the export audio graph.
 *
 * Completion is tracked by two latches combined with AND. audioDone follows
 * the effective audio element, videoDone the video element (and starts set
 * when there is no video). A latch is set either by the element's own
 * endReached signal or by evaluate() observing
 * currentTime >= max(0, duration - tolerance), so a missing end event never
 * stalls the export. Once both are set the synchronizer pauses everything,
 * restores default mute state and disconnects its graph node.
 */

#pragma once
#include <optional>
#include <QImage>
#include "SegmentPlan.hpp"
#include "audio/AudioGraph.hpp"
#include "util/Signal.hpp"

namespace rs {

enum class SyncState { Idle, Priming, Playing, Completing, Done };

const char* syncStateName(SyncState state);

struct SyncPolicy {
    f64 completionTolerance{0.05};
    bool videoAudioReplacesSpeech{true};
};

class SegmentSynchronizer {
public:
    SegmentSynchronizer(const SegmentPlan& plan, AudioGraph& graph, SyncPolicy policy = {});
    ~SegmentSynchronizer();

    SegmentSynchronizer(const SegmentSynchronizer&) = delete;
    SegmentSynchronizer& operator=(const SegmentSynchronizer&) = delete;

    Result<void> prime();
    Result<void> start();

    // Moves every active element forward by dt seconds
    Result<void> advance(f64 dt);

    // Polls both clocks and updates the latches; may reach Done
    void evaluate();

    // Idempotent; forced completion when called before both latches are set
    void finish();

    SyncState state() const {
        return state_;
    }
    bool isDone() const {
        return state_ == SyncState::Done;
    }
    bool audioDone() const {
        return audioDone_;
    }
    bool videoDone() const {
        return videoDone_;
    }

    // The video picture is drawn until the video clock completes
    bool showVideo() const;
    const QImage& videoFrame() const;

    MediaAssetHandle* audibleHandle() const {
        return audible_;
    }

private:
    static bool reached(const MediaAssetHandle& handle, f64 tolerance);
    void setAudioDone();
    void setVideoDone();
    void checkCompletion();
    Result<void> failPriming(Error error);

    const SegmentPlan& plan_;
    AudioGraph& graph_;
    SyncPolicy policy_;

    SyncState state_{SyncState::Idle};
    bool audioDone_{false};
    bool videoDone_{false};

    MediaAssetHandle* audible_{nullptr};
    AudioSourceNode* node_{nullptr};

    std::optional<ScopedConnection<>> audioEnded_;
    std::optional<ScopedConnection<>> videoEnded_;
};

} // namespace rs

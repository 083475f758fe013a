/**
 * @file MediaElement.hpp
 * @brief Playable audio/video element with its own playback clock.
 *
 * A MediaElement is the engine's equivalent of a media player object: it is
 * loaded once (which resolves its duration), can be rewound, played, paused
 * and muted, and advances its own position when the frame loop calls
 * advance(). Pictures are exposed as the latest decoded frame; audio is
 * exposed only through drainAudio(), which the audio graph calls for the one
 * node bound to this element.
 *
 * Elements are not thread-safe. An element may be loaded on a worker thread
 * (see DurationResolver) and then used from the export thread once that load
 * has completed.
 */

#pragma once
#include <QImage>
#include <optional>
#include <vector>
#include "util/Result.hpp"
#include "util/Signal.hpp"
#include "util/Types.hpp"

namespace rs {

struct AudioFormat {
    u32 sampleRate{48000};
    u32 channels{2};

    bool operator==(const AudioFormat&) const = default;
};

class MediaElement {
public:
    virtual ~MediaElement() = default;

    // Opens the source and reads metadata. Must succeed before anything else.
    virtual Result<void> load() = 0;
    virtual bool isLoaded() const = 0;

    // Empty until load() has succeeded
    virtual std::optional<f64> duration() const = 0;

    virtual bool hasAudio() const = 0;
    virtual bool hasVideo() const = 0;

    virtual void play() = 0;
    virtual void pause() = 0;
    virtual Result<void> rewind() = 0;

    virtual bool isPlaying() const = 0;
    virtual bool ended() const = 0;
    virtual f64 currentTime() const = 0;

    virtual void setMuted(bool muted) = 0;
    virtual bool muted() const = 0;

    // Moves the playback position forward by dt seconds while playing,
    // decoding whatever audio and pictures that interval covers.
    virtual Result<void> advance(f64 dt) = 0;

    // Latest picture at or before currentTime(); null for audio-only sources
    virtual const QImage& currentFrame() const = 0;

    // Routed elements buffer their decoded audio for drainAudio(); unrouted
    // elements discard it. Only AudioSourceNode toggles this.
    virtual void setAudioRouted(bool routed) = 0;

    // Appends up to maxFrames interleaved frames of buffered audio to out and
    // returns the number of frames appended. Muted elements yield silence.
    virtual usize drainAudio(std::vector<f32>& out, usize maxFrames) = 0;

    virtual AudioFormat audioFormat() const = 0;

    // Fired once when playback runs off the end of the media
    Signal<> endReached;
};

} // namespace rs

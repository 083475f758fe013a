/**
 * @file FFmpegMediaElement.hpp
 * @brief MediaElement backed by an FFmpeg demuxer and decoders.
 *
 * Decoding is pull-driven: advance() decodes exactly as much audio and as
 * many pictures as the new playback position requires. Audio is resampled to
 * the element's AudioFormat (interleaved float) and pictures are converted to
 * RGBA QImages at their native size; the compositor does the scaling.
 *
 * @section Dependencies
 * - FFmpeg (libavformat, libavcodec, libswscale, libswresample)
 * - Qt Gui (QImage)
 */

#pragma once
#include <deque>
#include "FFmpegUtils.hpp"
#include "MediaElement.hpp"
#include "MediaSource.hpp"

namespace rs {

class FFmpegMediaElement : public MediaElement {
public:
    FFmpegMediaElement(MediaSource source, AudioFormat format);
    ~FFmpegMediaElement() override;

    FFmpegMediaElement(const FFmpegMediaElement&) = delete;
    FFmpegMediaElement& operator=(const FFmpegMediaElement&) = delete;

    Result<void> load() override;
    bool isLoaded() const override {
        return loaded_;
    }
    std::optional<f64> duration() const override;

    bool hasAudio() const override {
        return audioStream_ >= 0;
    }
    bool hasVideo() const override {
        return videoStream_ >= 0;
    }

    void play() override;
    void pause() override;
    Result<void> rewind() override;

    bool isPlaying() const override {
        return playing_;
    }
    bool ended() const override {
        return ended_;
    }
    f64 currentTime() const override {
        return position_;
    }

    void setMuted(bool muted) override {
        muted_ = muted;
    }
    bool muted() const override {
        return muted_;
    }

    Result<void> advance(f64 dt) override;

    const QImage& currentFrame() const override {
        return frame_;
    }

    void setAudioRouted(bool routed) override;
    usize drainAudio(std::vector<f32>& out, usize maxFrames) override;

    AudioFormat audioFormat() const override {
        return format_;
    }

private:
    Result<void> setupAudio();
    Result<void> setupVideo();
    Result<f64> probeDuration();
    Result<f64> scanDuration();

    Result<void> readPacket();
    // true when a frame was produced, false once the decoder is drained
    Result<bool> receiveAudio();
    Result<bool> receiveVideo(AVFrame* into);

    Result<void> pumpAudio(f64 until);
    Result<void> pumpVideo(f64 until);
    Result<void> convertPicture(const AVFrame* src);

    f64 framePts(const AVFrame* frame, int streamIndex) const;
    bool reachedEnd() const;
    void resetDecodeState();
    void cleanup();

    MediaSource source_;
    AudioFormat format_;

    InputContext input_;
    AVPacketPtr packet_;
    AVFramePtr scratch_;
    bool demuxEof_{false};

    // Audio
    int audioStream_{-1};
    AVCodecContextPtr audioDec_;
    SwrContextPtr swr_;
    std::deque<AVPacketPtr> audioPackets_;
    std::vector<f32> audioFifo_; // decoded, not yet emitted
    u64 audioDecodedFrames_{0};  // total frames pushed into the fifo
    u64 audioEmittedFrames_{0};  // total frames taken out of the fifo
    bool audioFlushed_{false};
    bool audioEof_{false};
    std::vector<f32> pending_; // emitted, waiting for drainAudio()
    bool routed_{false};

    // Video
    int videoStream_{-1};
    AVCodecContextPtr videoDec_;
    SwsContextPtr sws_;
    std::deque<AVPacketPtr> videoPackets_;
    AVFramePtr nextPicture_;
    AVFramePtr shownPicture_;
    bool hasNextPicture_{false};
    f64 nextPicturePts_{0.0};
    f64 lastPicturePts_{-1.0};
    f64 pictureDuration_{0.0};
    bool videoFlushed_{false};
    bool videoEof_{false};
    QImage frame_;

    // Playback
    std::optional<f64> duration_;
    f64 position_{0.0};
    bool loaded_{false};
    bool playing_{false};
    bool ended_{false};
    bool muted_{false};
};

} // namespace rs

/**
 * @file CaptureEncoder.hpp
 * @brief FFmpeg encoder and muxer for the composited output.
 *
 * Owns the output format context, one video and one audio encoder, and the
 * swscale/swresample contexts that convert RGBA pictures to YUV 4:2:0 and
 * interleaved float audio to the audio encoder's sample format. Video pts
 * count frames; audio pts count samples, so the two tracks stay in step as
 * long as callers feed one frame period of audio per picture.
 *
 * Not thread-safe; FFmpegCaptureSink drives it from its worker thread.
 *
 * @section Dependencies
 * - FFmpeg (libavcodec, libavformat, libswscale, libswresample)
 */

#pragma once
#include <QImage>
#include <vector>
#include "EncoderSettings.hpp"
#include "media/FFmpegUtils.hpp"
#include "util/Result.hpp"

namespace rs {

class CaptureEncoder {
public:
    CaptureEncoder();
    ~CaptureEncoder();

    CaptureEncoder(const CaptureEncoder&) = delete;
    CaptureEncoder& operator=(const CaptureEncoder&) = delete;

    Result<void> init(const EncoderSettings& settings);

    Result<void> encodeVideo(const QImage& frame);
    // Consumes whole encoder frames from the front of buffer
    Result<void> encodeAudio(std::vector<f32>& buffer);

    // Pads and encodes leftover audio, drains both encoders, writes the trailer
    Result<void> finish(std::vector<f32>& leftoverAudio);
    void cleanup();

    u64 framesWritten() const {
        return static_cast<u64>(videoFrameCount_);
    }
    u64 bytesWritten() const {
        return bytesWritten_;
    }

private:
    Result<void> initVideoStream(const EncoderSettings& settings);
    Result<void> initAudioStream(const EncoderSettings& settings);

    Result<void> encodeFrame(AVCodecContext* codec, AVStream* stream, AVFrame* frame);
    Result<void> writePacket(AVCodecContext* codec, AVStream* stream, AVPacket* packet);

    AVFormatContextPtr formatCtx_;
    AVCodecContextPtr videoCodecCtx_;
    AVCodecContextPtr audioCodecCtx_;
    AVStream* videoStream_{nullptr};
    AVStream* audioStream_{nullptr};

    SwsContextPtr swsCtx_;
    SwrContextPtr swrCtx_;

    AVFramePtr videoFrame_;
    AVFramePtr audioFrame_;
    AVPacketPtr packet_;

    u32 channels_{2};
    int audioFrameSize_{1024};
    i64 videoFrameCount_{0};
    i64 audioSampleCount_{0};
    u64 bytesWritten_{0};
    bool headerWritten_{false};
};

} // namespace rs

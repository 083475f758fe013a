#include "CaptureEncoder.hpp"
#include <libavcodec/version.h>
#include <algorithm>
#include "core/Logger.hpp"

#if LIBAVCODEC_VERSION_MAJOR >= 60
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace rs {

namespace {

Result<void> captureError(std::string msg, int ret = 0) {
    if (ret < 0) {
        msg += ": " + ffmpegError(ret);
    }
    return Result<void>::err(ErrorCode::Capture, std::move(msg));
}

} // namespace

CaptureEncoder::CaptureEncoder() = default;

CaptureEncoder::~CaptureEncoder() {
    cleanup();
}

Result<void> CaptureEncoder::init(const EncoderSettings& settings) {
    const std::string path = settings.outputPath.string();

    AVFormatContext* ctx = nullptr;
    int ret = avformat_alloc_output_context2(
            &ctx, nullptr, settings.candidate.container.c_str(), path.c_str());
    formatCtx_.reset(ctx);
    if (ret < 0 || !formatCtx_) {
        return captureError("Failed to create output context", ret);
    }

    if (auto result = initVideoStream(settings); !result) {
        return result;
    }
    if (auto result = initAudioStream(settings); !result) {
        return result;
    }

    if (!(formatCtx_->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(&formatCtx_->pb, path.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0) {
            return captureError("Failed to open output file", ret);
        }
    }

    AVDictionary* opts = nullptr;
    if (settings.candidate.container == "mp4") {
        av_dict_set(&opts, "movflags", "+faststart", 0);
    }
    ret = avformat_write_header(formatCtx_.get(), &opts);
    av_dict_free(&opts);
    if (ret < 0) {
        return captureError("Failed to write header", ret);
    }
    headerWritten_ = true;

    packet_.reset(av_packet_alloc());
    if (!packet_) {
        return captureError("Failed to allocate packet");
    }

    LOG_DEBUG("Encoder ready: {} {}x{}@{} {} + {}",
              settings.candidate.container,
              settings.width,
              settings.height,
              settings.fps,
              settings.candidate.videoCodec,
              settings.candidate.audioCodec);
    return Result<void>::ok();
}

void CaptureEncoder::cleanup() {
    packet_.reset();
    videoFrame_.reset();
    audioFrame_.reset();
    swsCtx_.reset();
    swrCtx_.reset();
    videoCodecCtx_.reset();
    audioCodecCtx_.reset();
    formatCtx_.reset();

    videoStream_ = nullptr;
    audioStream_ = nullptr;
    videoFrameCount_ = 0;
    audioSampleCount_ = 0;
    headerWritten_ = false;
}

Result<void> CaptureEncoder::initVideoStream(const EncoderSettings& settings) {
    const AVCodec* codec =
            avcodec_find_encoder_by_name(settings.candidate.videoCodec.c_str());
    if (!codec) {
        return captureError("Video encoder not found: " + settings.candidate.videoCodec);
    }

    videoStream_ = avformat_new_stream(formatCtx_.get(), nullptr);
    if (!videoStream_) {
        return captureError("Failed to create video stream");
    }

    videoCodecCtx_.reset(avcodec_alloc_context3(codec));
    if (!videoCodecCtx_) {
        return captureError("Failed to allocate video codec context");
    }

    const int fps = static_cast<int>(settings.fps);
    videoCodecCtx_->width = static_cast<int>(settings.width);
    videoCodecCtx_->height = static_cast<int>(settings.height);
    videoCodecCtx_->time_base = AVRational{1, fps};
    videoCodecCtx_->framerate = AVRational{fps, 1};
    videoCodecCtx_->pix_fmt = AV_PIX_FMT_YUV420P;
    videoCodecCtx_->gop_size = fps * 2;
    videoCodecCtx_->max_b_frames = 0;
    videoCodecCtx_->bit_rate = static_cast<i64>(settings.videoBitrate) * 1000;

    if (formatCtx_->oformat->flags & AVFMT_GLOBALHEADER) {
        videoCodecCtx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    AVDictionary* opts = nullptr;
    const std::string& name = settings.candidate.videoCodec;
    if (name == "libx264" || name == "libx265") {
        av_dict_set(&opts, "preset", settings.preset.c_str(), 0);
        av_dict_set(&opts, "tune", "zerolatency", 0);
    } else if (name == "libvpx" || name == "libvpx-vp9") {
        av_dict_set(&opts, "deadline", "realtime", 0);
        av_dict_set(&opts, "cpu-used", "8", 0);
    }

    int ret = avcodec_open2(videoCodecCtx_.get(), codec, &opts);
    av_dict_free(&opts);
    if (ret < 0) {
        return captureError("Failed to open video encoder", ret);
    }

    avcodec_parameters_from_context(videoStream_->codecpar, videoCodecCtx_.get());
    videoStream_->time_base = videoCodecCtx_->time_base;

    videoFrame_.reset(av_frame_alloc());
    if (!videoFrame_) {
        return captureError("Failed to allocate video frame");
    }
    videoFrame_->format = videoCodecCtx_->pix_fmt;
    videoFrame_->width = videoCodecCtx_->width;
    videoFrame_->height = videoCodecCtx_->height;
    ret = av_frame_get_buffer(videoFrame_.get(), 0);
    if (ret < 0) {
        return captureError("Failed to allocate video buffer", ret);
    }

    return Result<void>::ok();
}

Result<void> CaptureEncoder::initAudioStream(const EncoderSettings& settings) {
    const AVCodec* codec =
            avcodec_find_encoder_by_name(settings.candidate.audioCodec.c_str());
    if (!codec) {
        return captureError("Audio encoder not found: " + settings.candidate.audioCodec);
    }

    audioStream_ = avformat_new_stream(formatCtx_.get(), nullptr);
    if (!audioStream_) {
        return captureError("Failed to create audio stream");
    }

    audioCodecCtx_.reset(avcodec_alloc_context3(codec));
    if (!audioCodecCtx_) {
        return captureError("Failed to allocate audio codec context");
    }

    channels_ = settings.audio.channels;
    int sampleRate = static_cast<int>(settings.audio.sampleRate);
    if (codec->supported_samplerates) {
        bool found = false;
        for (const int* r = codec->supported_samplerates; *r; ++r) {
            found = found || *r == sampleRate;
        }
        if (!found) {
            return captureError("Audio encoder does not support " +
                                std::to_string(sampleRate) + " Hz");
        }
    }

    audioCodecCtx_->sample_rate = sampleRate;
    audioCodecCtx_->bit_rate = static_cast<i64>(settings.audioBitrate) * 1000;

    AVChannelLayout layout;
    av_channel_layout_default(&layout, static_cast<int>(channels_));
    av_channel_layout_copy(&audioCodecCtx_->ch_layout, &layout);

    audioCodecCtx_->sample_fmt =
            codec->sample_fmts ? codec->sample_fmts[0] : AV_SAMPLE_FMT_FLTP;
    audioCodecCtx_->time_base = AVRational{1, sampleRate};

    if (formatCtx_->oformat->flags & AVFMT_GLOBALHEADER) {
        audioCodecCtx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    int ret = avcodec_open2(audioCodecCtx_.get(), codec, nullptr);
    if (ret < 0) {
        av_channel_layout_uninit(&layout);
        return captureError("Failed to open audio encoder", ret);
    }

    avcodec_parameters_from_context(audioStream_->codecpar, audioCodecCtx_.get());
    audioStream_->time_base = audioCodecCtx_->time_base;

    // Variable-frame-size encoders report 0
    audioFrameSize_ = audioCodecCtx_->frame_size > 0 ? audioCodecCtx_->frame_size : 1024;

    audioFrame_.reset(av_frame_alloc());
    if (!audioFrame_) {
        av_channel_layout_uninit(&layout);
        return captureError("Failed to allocate audio frame");
    }
    audioFrame_->format = audioCodecCtx_->sample_fmt;
    av_channel_layout_copy(&audioFrame_->ch_layout, &audioCodecCtx_->ch_layout);
    audioFrame_->sample_rate = audioCodecCtx_->sample_rate;
    audioFrame_->nb_samples = audioFrameSize_;
    ret = av_frame_get_buffer(audioFrame_.get(), 0);
    if (ret < 0) {
        av_channel_layout_uninit(&layout);
        return captureError("Failed to allocate audio buffer", ret);
    }

    SwrContext* s = nullptr;
    ret = swr_alloc_set_opts2(&s,
                              &audioCodecCtx_->ch_layout,
                              audioCodecCtx_->sample_fmt,
                              audioCodecCtx_->sample_rate,
                              &layout,
                              AV_SAMPLE_FMT_FLT,
                              sampleRate,
                              0,
                              nullptr);
    swrCtx_.reset(s);
    av_channel_layout_uninit(&layout);
    if (ret < 0 || (ret = swr_init(swrCtx_.get())) < 0) {
        return captureError("Failed to configure audio resampler", ret);
    }

    return Result<void>::ok();
}

Result<void> CaptureEncoder::encodeVideo(const QImage& frame) {
    if (!videoCodecCtx_ || !videoFrame_) {
        return captureError("Encoder not initialized");
    }
    if (frame.isNull()) {
        return captureError("Null video frame");
    }

    const QImage rgba = frame.format() == QImage::Format_RGBA8888
                                ? frame
                                : frame.convertToFormat(QImage::Format_RGBA8888);

    swsCtx_.reset(sws_getCachedContext(swsCtx_.release(),
                                       rgba.width(),
                                       rgba.height(),
                                       AV_PIX_FMT_RGBA,
                                       videoCodecCtx_->width,
                                       videoCodecCtx_->height,
                                       videoCodecCtx_->pix_fmt,
                                       SWS_BILINEAR,
                                       nullptr,
                                       nullptr,
                                       nullptr));
    if (!swsCtx_) {
        return captureError("Failed to create scaler");
    }

    int ret = av_frame_make_writable(videoFrame_.get());
    if (ret < 0) {
        return captureError("Video frame not writable", ret);
    }

    const u8* srcData[1] = {rgba.constBits()};
    int srcLinesize[1] = {static_cast<int>(rgba.bytesPerLine())};
    sws_scale(swsCtx_.get(),
              srcData,
              srcLinesize,
              0,
              rgba.height(),
              videoFrame_->data,
              videoFrame_->linesize);

    videoFrame_->pts = videoFrameCount_++;
    return encodeFrame(videoCodecCtx_.get(), videoStream_, videoFrame_.get());
}

Result<void> CaptureEncoder::encodeAudio(std::vector<f32>& buffer) {
    if (!audioCodecCtx_ || !audioFrame_) {
        return captureError("Encoder not initialized");
    }

    const usize chunk = static_cast<usize>(audioFrameSize_) * channels_;
    usize consumed = 0;
    while (buffer.size() - consumed >= chunk) {
        int ret = av_frame_make_writable(audioFrame_.get());
        if (ret < 0) {
            return captureError("Audio frame not writable", ret);
        }

        const u8* srcData[1] = {reinterpret_cast<const u8*>(buffer.data() + consumed)};
        ret = swr_convert(swrCtx_.get(),
                          audioFrame_->data,
                          audioFrameSize_,
                          srcData,
                          audioFrameSize_);
        consumed += chunk;
        if (ret < 0) {
            return captureError("Audio resample failed", ret);
        }

        audioFrame_->nb_samples = audioFrameSize_;
        audioFrame_->pts = audioSampleCount_;
        audioSampleCount_ += audioFrameSize_;

        if (auto r = encodeFrame(audioCodecCtx_.get(), audioStream_, audioFrame_.get()); !r) {
            buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(consumed));
            return r;
        }
    }
    buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(consumed));
    return Result<void>::ok();
}

Result<void> CaptureEncoder::finish(std::vector<f32>& leftoverAudio) {
    if (!formatCtx_ || !headerWritten_) {
        return captureError("Encoder not initialized");
    }

    if (!leftoverAudio.empty()) {
        const usize chunk = static_cast<usize>(audioFrameSize_) * channels_;
        const usize rem = leftoverAudio.size() % chunk;
        if (rem) {
            leftoverAudio.resize(leftoverAudio.size() + (chunk - rem), 0.0f);
        }
        if (auto r = encodeAudio(leftoverAudio); !r) {
            return r;
        }
    }

    if (auto r = encodeFrame(videoCodecCtx_.get(), videoStream_, nullptr); !r) {
        return r;
    }
    if (auto r = encodeFrame(audioCodecCtx_.get(), audioStream_, nullptr); !r) {
        return r;
    }

    int ret = av_write_trailer(formatCtx_.get());
    headerWritten_ = false;
    if (ret < 0) {
        return captureError("Failed to write trailer", ret);
    }

    // Closes the output file
    formatCtx_.reset();
    LOG_DEBUG("Encoder finished: {} frames, {} audio samples, {} bytes",
              videoFrameCount_,
              audioSampleCount_,
              bytesWritten_);
    return Result<void>::ok();
}

Result<void> CaptureEncoder::encodeFrame(AVCodecContext* codec,
                                         AVStream* stream,
                                         AVFrame* frame) {
    int ret = avcodec_send_frame(codec, frame);
    if (ret < 0) {
        return captureError("Encoder rejected frame", ret);
    }

    while (true) {
        ret = avcodec_receive_packet(codec, packet_.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            break;
        }
        if (ret < 0) {
            return captureError("Encoding failed", ret);
        }
        if (auto r = writePacket(codec, stream, packet_.get()); !r) {
            return r;
        }
    }
    return Result<void>::ok();
}

Result<void> CaptureEncoder::writePacket(AVCodecContext* codec,
                                         AVStream* stream,
                                         AVPacket* packet) {
    av_packet_rescale_ts(packet, codec->time_base, stream->time_base);
    packet->stream_index = stream->index;
    const int size = packet->size;

    // Takes ownership of the packet reference
    int ret = av_interleaved_write_frame(formatCtx_.get(), packet);
    if (ret < 0) {
        return captureError("Failed to write packet", ret);
    }
    bytesWritten_ += static_cast<u64>(size);
    return Result<void>::ok();
}

} // namespace rs

#if LIBAVCODEC_VERSION_MAJOR >= 60
#pragma GCC diagnostic pop
#endif

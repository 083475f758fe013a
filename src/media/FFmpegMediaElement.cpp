#include "FFmpegMediaElement.hpp"
#include <algorithm>
#include <cmath>
#include "core/Logger.hpp"

namespace rs {

namespace {

f64 streamStart(const AVStream* st) {
    return st->start_time != AV_NOPTS_VALUE
                   ? static_cast<f64>(st->start_time) * av_q2d(st->time_base)
                   : 0.0;
}

} // namespace

FFmpegMediaElement::FFmpegMediaElement(MediaSource source, AudioFormat format)
    : source_(std::move(source)), format_(format) {
}

FFmpegMediaElement::~FFmpegMediaElement() {
    cleanup();
}

Result<void> FFmpegMediaElement::load() {
    if (loaded_) {
        return Result<void>::ok();
    }

    auto fail = [this](Error e) {
        cleanup();
        e.forAsset(source_.describe());
        return Result<void>::err(std::move(e));
    };

    auto input = openInput(source_);
    if (!input) {
        return fail(input.error());
    }
    input_ = std::move(*input);
    AVFormatContext* fmt = input_.format.get();

    int audio = av_find_best_stream(fmt, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    audioStream_ = audio >= 0 ? audio : -1;

    // Cover art in audio files shows up as a single-picture video stream
    if (source_.kind() != MediaKind::Audio) {
        int video = av_find_best_stream(
                fmt, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
        if (video >= 0 &&
            !(fmt->streams[video]->disposition & AV_DISPOSITION_ATTACHED_PIC)) {
            videoStream_ = video;
        }
    }

    if (audioStream_ < 0 && videoStream_ < 0) {
        return fail(Error(ErrorCode::AssetLoad, "No audio or video stream"));
    }

    if (audioStream_ >= 0) {
        if (auto r = setupAudio(); !r) {
            return fail(r.error());
        }
    }
    if (videoStream_ >= 0) {
        if (auto r = setupVideo(); !r) {
            return fail(r.error());
        }
    }

    packet_.reset(av_packet_alloc());
    scratch_.reset(av_frame_alloc());
    nextPicture_.reset(av_frame_alloc());
    shownPicture_.reset(av_frame_alloc());
    if (!packet_ || !scratch_ || !nextPicture_ || !shownPicture_) {
        return fail(Error(ErrorCode::AssetLoad, "Out of memory"));
    }

    auto dur = probeDuration();
    if (!dur) {
        return fail(dur.error());
    }
    duration_ = *dur;
    loaded_ = true;

    LOG_DEBUG("Loaded {}: {:.3f}s audio={} video={}",
              source_.describe(),
              *duration_,
              hasAudio(),
              hasVideo());

    // Show the first picture before playback starts
    if (auto r = pumpVideo(0.0); !r) {
        loaded_ = false;
        duration_.reset();
        return fail(r.error());
    }
    return Result<void>::ok();
}

std::optional<f64> FFmpegMediaElement::duration() const {
    return duration_;
}

Result<void> FFmpegMediaElement::setupAudio() {
    auto dec = openDecoder(input_.format.get(), audioStream_);
    if (!dec) {
        return Result<void>::err(dec.error());
    }
    audioDec_ = std::move(*dec);

    AVChannelLayout outLayout{};
    av_channel_layout_default(&outLayout, static_cast<int>(format_.channels));

    AVChannelLayout inLayout{};
    if (audioDec_->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC ||
        audioDec_->ch_layout.nb_channels == 0) {
        av_channel_layout_default(
                &inLayout, std::max(1, audioDec_->ch_layout.nb_channels));
    } else {
        av_channel_layout_copy(&inLayout, &audioDec_->ch_layout);
    }

    SwrContext* swr = nullptr;
    int ret = swr_alloc_set_opts2(&swr,
                                  &outLayout,
                                  AV_SAMPLE_FMT_FLT,
                                  static_cast<int>(format_.sampleRate),
                                  &inLayout,
                                  audioDec_->sample_fmt,
                                  audioDec_->sample_rate,
                                  0,
                                  nullptr);
    swr_.reset(swr);
    av_channel_layout_uninit(&inLayout);
    av_channel_layout_uninit(&outLayout);

    if (ret < 0) {
        return Result<void>::err(ErrorCode::AssetLoad,
                                 "Could not configure resampler: " +
                                         ffmpegError(ret));
    }
    ret = swr_init(swr_.get());
    if (ret < 0) {
        return Result<void>::err(ErrorCode::AssetLoad,
                                 "Could not initialize resampler: " +
                                         ffmpegError(ret));
    }
    return Result<void>::ok();
}

Result<void> FFmpegMediaElement::setupVideo() {
    auto dec = openDecoder(input_.format.get(), videoStream_);
    if (!dec) {
        return Result<void>::err(dec.error());
    }
    videoDec_ = std::move(*dec);

    const AVStream* st = input_.format->streams[videoStream_];
    AVRational rate = st->avg_frame_rate;
    if (rate.num <= 0 || rate.den <= 0) {
        rate = st->r_frame_rate;
    }
    pictureDuration_ =
            (rate.num > 0 && rate.den > 0) ? 1.0 / av_q2d(rate) : 1.0 / 25.0;
    return Result<void>::ok();
}

Result<f64> FFmpegMediaElement::probeDuration() {
    AVFormatContext* fmt = input_.format.get();
    if (fmt->duration != AV_NOPTS_VALUE && fmt->duration >= 0) {
        return Result<f64>::ok(static_cast<f64>(fmt->duration) / AV_TIME_BASE);
    }

    f64 best = -1.0;
    for (int idx : {audioStream_, videoStream_}) {
        if (idx < 0) {
            continue;
        }
        const AVStream* st = fmt->streams[idx];
        if (st->duration != AV_NOPTS_VALUE) {
            best = std::max(best,
                            static_cast<f64>(st->duration) * av_q2d(st->time_base));
        }
    }
    if (best >= 0.0) {
        return Result<f64>::ok(best);
    }

    // Streamed containers (webm from a recorder, raw ADTS) carry no duration
    return scanDuration();
}

Result<f64> FFmpegMediaElement::scanDuration() {
    AVFormatContext* fmt = input_.format.get();
    AVPacketPtr pkt(av_packet_alloc());
    if (!pkt) {
        return Result<f64>::err(ErrorCode::AssetLoad, "Out of memory");
    }

    f64 end = 0.0;
    int ret = 0;
    while ((ret = av_read_frame(fmt, pkt.get())) >= 0) {
        const int idx = pkt->stream_index;
        if (idx == audioStream_ || idx == videoStream_) {
            const AVStream* st = fmt->streams[idx];
            i64 ts = pkt->pts != AV_NOPTS_VALUE ? pkt->pts : pkt->dts;
            if (ts != AV_NOPTS_VALUE) {
                f64 t = static_cast<f64>(ts + pkt->duration) *
                                av_q2d(st->time_base) -
                        streamStart(st);
                end = std::max(end, t);
            }
        }
        av_packet_unref(pkt.get());
    }
    if (!readEndedCleanly(fmt, ret)) {
        return Result<f64>::err(ErrorCode::AssetLoad,
                                "Read error while scanning: " + ffmpegError(ret));
    }

    ret = av_seek_frame(fmt, -1, 0, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        return Result<f64>::err(ErrorCode::AssetLoad,
                                "Source is not seekable: " + ffmpegError(ret));
    }
    LOG_DEBUG("Scanned duration of {}: {:.3f}s", source_.describe(), end);
    return Result<f64>::ok(end);
}

void FFmpegMediaElement::play() {
    if (!loaded_) {
        LOG_WARN("play() before load(): {}", source_.describe());
        return;
    }
    if (ended_) {
        if (auto r = rewind(); !r) {
            LOG_ERROR("Replay failed: {}", r.error().describe());
            return;
        }
    }
    playing_ = true;
}

void FFmpegMediaElement::pause() {
    playing_ = false;
}

Result<void> FFmpegMediaElement::rewind() {
    if (!loaded_) {
        return Result<void>::err(ErrorCode::Programming,
                                 "rewind() before load()");
    }

    AVFormatContext* fmt = input_.format.get();
    int ret = av_seek_frame(fmt, -1, 0, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        Error e(ErrorCode::AssetLoad, "Seek failed: " + ffmpegError(ret));
        e.forAsset(source_.describe());
        return Result<void>::err(std::move(e));
    }

    resetDecodeState();
    position_ = 0.0;
    ended_ = false;
    return pumpVideo(0.0);
}

void FFmpegMediaElement::resetDecodeState() {
    demuxEof_ = false;
    audioPackets_.clear();
    videoPackets_.clear();

    if (audioDec_) {
        avcodec_flush_buffers(audioDec_.get());
    }
    if (swr_) {
        swr_close(swr_.get());
        int ret = swr_init(swr_.get());
        if (ret < 0) {
            LOG_WARN("Resampler reset failed: {}", ffmpegError(ret));
        }
    }
    audioFifo_.clear();
    pending_.clear();
    audioDecodedFrames_ = 0;
    audioEmittedFrames_ = 0;
    audioFlushed_ = false;
    audioEof_ = false;

    if (videoDec_) {
        avcodec_flush_buffers(videoDec_.get());
    }
    if (nextPicture_) {
        av_frame_unref(nextPicture_.get());
    }
    hasNextPicture_ = false;
    nextPicturePts_ = 0.0;
    lastPicturePts_ = -1.0;
    videoFlushed_ = false;
    videoEof_ = false;
}

Result<void> FFmpegMediaElement::advance(f64 dt) {
    if (!loaded_) {
        return Result<void>::err(ErrorCode::Programming,
                                 "advance() before load()");
    }
    if (!playing_ || ended_) {
        return Result<void>::ok();
    }

    position_ += std::max(0.0, dt);

    if (auto r = pumpAudio(position_); !r) {
        return r;
    }
    if (auto r = pumpVideo(position_); !r) {
        return r;
    }

    if (reachedEnd()) {
        playing_ = false;
        ended_ = true;
        LOG_TRACE("Ended at {:.3f}s: {}", position_, source_.describe());
        endReached.emitSignal();
    }
    return Result<void>::ok();
}

Result<void> FFmpegMediaElement::readPacket() {
    if (demuxEof_) {
        return Result<void>::ok();
    }

    AVFormatContext* fmt = input_.format.get();
    int ret = av_read_frame(fmt, packet_.get());
    if (ret < 0 && readEndedCleanly(fmt, ret)) {
        demuxEof_ = true;
        return Result<void>::ok();
    }
    if (ret < 0) {
        Error e(ErrorCode::AssetLoad, "Read error: " + ffmpegError(ret));
        e.forAsset(source_.describe());
        return Result<void>::err(std::move(e));
    }

    const int idx = packet_->stream_index;
    if (idx == audioStream_ || idx == videoStream_) {
        AVPacketPtr copy(av_packet_alloc());
        if (!copy) {
            av_packet_unref(packet_.get());
            return Result<void>::err(ErrorCode::AssetLoad, "Out of memory");
        }
        av_packet_move_ref(copy.get(), packet_.get());
        (idx == audioStream_ ? audioPackets_ : videoPackets_)
                .push_back(std::move(copy));
    } else {
        av_packet_unref(packet_.get());
    }
    return Result<void>::ok();
}

Result<bool> FFmpegMediaElement::receiveAudio() {
    const int channels = static_cast<int>(format_.channels);

    while (true) {
        int ret = avcodec_receive_frame(audioDec_.get(), scratch_.get());
        if (ret == 0) {
            const int capacity =
                    swr_get_out_samples(swr_.get(), scratch_->nb_samples);
            const usize old = audioFifo_.size();
            audioFifo_.resize(old + static_cast<usize>(std::max(0, capacity)) *
                                            channels);
            u8* out = reinterpret_cast<u8*>(audioFifo_.data() + old);
            int got = swr_convert(swr_.get(),
                                  &out,
                                  capacity,
                                  const_cast<const u8**>(scratch_->extended_data),
                                  scratch_->nb_samples);
            av_frame_unref(scratch_.get());
            if (got < 0) {
                audioFifo_.resize(old);
                return Result<bool>::err(ErrorCode::AssetLoad,
                                         "Resample failed: " + ffmpegError(got));
            }
            audioFifo_.resize(old + static_cast<usize>(got) * channels);
            audioDecodedFrames_ += static_cast<u64>(got);
            return Result<bool>::ok(true);
        }

        if (ret == AVERROR_EOF) {
            // Drain whatever the resampler still holds
            const int tail = swr_get_out_samples(swr_.get(), 0);
            if (tail > 0) {
                const usize old = audioFifo_.size();
                audioFifo_.resize(old + static_cast<usize>(tail) * channels);
                u8* out = reinterpret_cast<u8*>(audioFifo_.data() + old);
                int got = swr_convert(swr_.get(), &out, tail, nullptr, 0);
                audioFifo_.resize(old + static_cast<usize>(std::max(0, got)) *
                                                channels);
                if (got > 0) {
                    audioDecodedFrames_ += static_cast<u64>(got);
                }
            }
            audioEof_ = true;
            return Result<bool>::ok(false);
        }

        if (ret != AVERROR(EAGAIN)) {
            return Result<bool>::err(ErrorCode::AssetLoad,
                                     "Audio decode failed: " + ffmpegError(ret));
        }

        if (audioPackets_.empty()) {
            if (!demuxEof_) {
                if (auto r = readPacket(); !r) {
                    return Result<bool>::err(r.error());
                }
                continue;
            }
            if (!audioFlushed_) {
                avcodec_send_packet(audioDec_.get(), nullptr);
                audioFlushed_ = true;
                continue;
            }
            audioEof_ = true;
            return Result<bool>::ok(false);
        }

        AVPacketPtr pkt = std::move(audioPackets_.front());
        audioPackets_.pop_front();
        ret = avcodec_send_packet(audioDec_.get(), pkt.get());
        if (ret < 0 && ret != AVERROR(EAGAIN)) {
            LOG_DEBUG("Dropped corrupt audio packet: {}", ffmpegError(ret));
        }
    }
}

Result<bool> FFmpegMediaElement::receiveVideo(AVFrame* into) {
    while (true) {
        int ret = avcodec_receive_frame(videoDec_.get(), into);
        if (ret == 0) {
            return Result<bool>::ok(true);
        }

        if (ret == AVERROR_EOF) {
            videoEof_ = true;
            return Result<bool>::ok(false);
        }
        if (ret != AVERROR(EAGAIN)) {
            return Result<bool>::err(ErrorCode::AssetLoad,
                                     "Video decode failed: " + ffmpegError(ret));
        }

        if (videoPackets_.empty()) {
            if (!demuxEof_) {
                if (auto r = readPacket(); !r) {
                    return Result<bool>::err(r.error());
                }
                continue;
            }
            if (!videoFlushed_) {
                avcodec_send_packet(videoDec_.get(), nullptr);
                videoFlushed_ = true;
                continue;
            }
            videoEof_ = true;
            return Result<bool>::ok(false);
        }

        AVPacketPtr pkt = std::move(videoPackets_.front());
        videoPackets_.pop_front();
        ret = avcodec_send_packet(videoDec_.get(), pkt.get());
        if (ret < 0 && ret != AVERROR(EAGAIN)) {
            LOG_DEBUG("Dropped corrupt video packet: {}", ffmpegError(ret));
        }
    }
}

Result<void> FFmpegMediaElement::pumpAudio(f64 until) {
    if (audioStream_ < 0) {
        return Result<void>::ok();
    }

    const u64 target =
            static_cast<u64>(std::llround(std::max(0.0, until) * format_.sampleRate));
    while (audioDecodedFrames_ < target && !audioEof_) {
        auto r = receiveAudio();
        if (!r) {
            return Result<void>::err(r.error());
        }
    }

    const u64 upto = std::min(target, audioDecodedFrames_);
    if (upto <= audioEmittedFrames_) {
        return Result<void>::ok();
    }

    const usize samples =
            static_cast<usize>(upto - audioEmittedFrames_) * format_.channels;
    if (routed_) {
        if (muted_) {
            pending_.insert(pending_.end(), samples, 0.0f);
        } else {
            pending_.insert(pending_.end(),
                            audioFifo_.begin(),
                            audioFifo_.begin() + static_cast<std::ptrdiff_t>(samples));
        }
    }
    audioFifo_.erase(audioFifo_.begin(),
                     audioFifo_.begin() + static_cast<std::ptrdiff_t>(samples));
    audioEmittedFrames_ = upto;
    return Result<void>::ok();
}

Result<void> FFmpegMediaElement::pumpVideo(f64 until) {
    if (videoStream_ < 0) {
        return Result<void>::ok();
    }

    bool changed = false;
    while (true) {
        if (!hasNextPicture_) {
            if (videoEof_) {
                break;
            }
            auto r = receiveVideo(nextPicture_.get());
            if (!r) {
                return Result<void>::err(r.error());
            }
            if (!*r) {
                break;
            }
            hasNextPicture_ = true;
            nextPicturePts_ = framePts(nextPicture_.get(), videoStream_);
        }

        // The first picture is shown immediately even if its pts is late
        if (lastPicturePts_ >= 0.0 && nextPicturePts_ > until + 1e-6) {
            break;
        }

        av_frame_unref(shownPicture_.get());
        av_frame_move_ref(shownPicture_.get(), nextPicture_.get());
        hasNextPicture_ = false;
        lastPicturePts_ = std::max(0.0, nextPicturePts_);
        changed = true;
    }

    if (changed) {
        return convertPicture(shownPicture_.get());
    }
    return Result<void>::ok();
}

Result<void> FFmpegMediaElement::convertPicture(const AVFrame* src) {
    const int w = src->width;
    const int h = src->height;
    if (w <= 0 || h <= 0) {
        return Result<void>::ok();
    }

    sws_.reset(sws_getCachedContext(sws_.release(),
                                    w,
                                    h,
                                    static_cast<AVPixelFormat>(src->format),
                                    w,
                                    h,
                                    AV_PIX_FMT_RGBA,
                                    SWS_BILINEAR,
                                    nullptr,
                                    nullptr,
                                    nullptr));
    if (!sws_) {
        return Result<void>::err(ErrorCode::AssetLoad,
                                 "Could not create picture converter");
    }

    if (frame_.width() != w || frame_.height() != h) {
        frame_ = QImage(w, h, QImage::Format_RGBA8888);
    }

    u8* dst[4] = {frame_.bits(), nullptr, nullptr, nullptr};
    int dstStride[4] = {static_cast<int>(frame_.bytesPerLine()), 0, 0, 0};
    sws_scale(sws_.get(), src->data, src->linesize, 0, h, dst, dstStride);
    return Result<void>::ok();
}

f64 FFmpegMediaElement::framePts(const AVFrame* frame, int streamIndex) const {
    const AVStream* st = input_.format->streams[streamIndex];
    i64 ts = frame->best_effort_timestamp;
    if (ts == AV_NOPTS_VALUE) {
        ts = frame->pts;
    }
    if (ts == AV_NOPTS_VALUE) {
        return lastPicturePts_ < 0.0 ? 0.0 : lastPicturePts_ + pictureDuration_;
    }
    return static_cast<f64>(ts) * av_q2d(st->time_base) - streamStart(st);
}

bool FFmpegMediaElement::reachedEnd() const {
    const bool audioDone = audioStream_ < 0 ||
                           (audioEof_ && audioEmittedFrames_ >= audioDecodedFrames_);
    const bool videoDone =
            videoStream_ < 0 ||
            (videoEof_ && !hasNextPicture_ &&
             position_ + 1e-6 >= std::max(0.0, lastPicturePts_) + pictureDuration_);
    return audioDone && videoDone;
}

void FFmpegMediaElement::setAudioRouted(bool routed) {
    routed_ = routed;
    if (!routed_) {
        pending_.clear();
    }
}

usize FFmpegMediaElement::drainAudio(std::vector<f32>& out, usize maxFrames) {
    const usize channels = format_.channels;
    const usize frames = std::min(maxFrames, pending_.size() / channels);
    const auto n = static_cast<std::ptrdiff_t>(frames * channels);
    out.insert(out.end(), pending_.begin(), pending_.begin() + n);
    pending_.erase(pending_.begin(), pending_.begin() + n);
    return frames;
}

void FFmpegMediaElement::cleanup() {
    audioPackets_.clear();
    videoPackets_.clear();
    audioDec_.reset();
    videoDec_.reset();
    swr_.reset();
    sws_.reset();
    packet_.reset();
    scratch_.reset();
    nextPicture_.reset();
    shownPicture_.reset();
    input_.format.reset();
    input_.reader.reset();
    audioStream_ = -1;
    videoStream_ = -1;
    playing_ = false;
}

} // namespace rs

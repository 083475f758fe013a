/**
 * @file FFmpegUtils.hpp
 * @brief RAII wrappers and helpers for the FFmpeg C API.
 *
 * Every FFmpeg object the engine allocates is owned by one of the unique_ptr
 * aliases below so that decode buffers and codec contexts are released
 * deterministically when their owner goes out of scope.
 *
 * @section Dependencies
 * - FFmpeg (libavformat, libavcodec, libavutil, libswscale, libswresample)
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "media/MediaSource.hpp"
#include "util/Result.hpp"
#include "util/Types.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

namespace rs {

struct AVInputContextDeleter {
    void operator()(AVFormatContext* ctx) const {
        avformat_close_input(&ctx);
    }
};

struct AVOutputContextDeleter {
    void operator()(AVFormatContext* ctx) const {
        if (ctx && ctx->oformat && !(ctx->oformat->flags & AVFMT_NOFILE)) {
            avio_closep(&ctx->pb);
        }
        avformat_free_context(ctx);
    }
};

struct AVCodecContextDeleter {
    void operator()(AVCodecContext* ctx) const {
        avcodec_free_context(&ctx);
    }
};

struct AVFrameDeleter {
    void operator()(AVFrame* frame) const {
        av_frame_free(&frame);
    }
};

struct AVPacketDeleter {
    void operator()(AVPacket* packet) const {
        av_packet_free(&packet);
    }
};

struct SwsContextDeleter {
    void operator()(SwsContext* ctx) const {
        sws_freeContext(ctx);
    }
};

struct SwrContextDeleter {
    void operator()(SwrContext* ctx) const {
        swr_free(&ctx);
    }
};

struct AVIOContextDeleter {
    void operator()(AVIOContext* ctx) const {
        if (ctx) {
            av_freep(&ctx->buffer);
        }
        avio_context_free(&ctx);
    }
};

using AVInputContextPtr = std::unique_ptr<AVFormatContext, AVInputContextDeleter>;
using AVFormatContextPtr =
        std::unique_ptr<AVFormatContext, AVOutputContextDeleter>;
using AVCodecContextPtr = std::unique_ptr<AVCodecContext, AVCodecContextDeleter>;
using AVFramePtr = std::unique_ptr<AVFrame, AVFrameDeleter>;
using AVPacketPtr = std::unique_ptr<AVPacket, AVPacketDeleter>;
using SwsContextPtr = std::unique_ptr<SwsContext, SwsContextDeleter>;
using SwrContextPtr = std::unique_ptr<SwrContext, SwrContextDeleter>;
using AVIOContextPtr = std::unique_ptr<AVIOContext, AVIOContextDeleter>;

std::string ffmpegError(int errnum);

// Seekable read-only AVIO over a shared byte buffer
class AvioMemoryReader {
public:
    explicit AvioMemoryReader(std::shared_ptr<const std::vector<u8>> data);

    AVIOContext* context() {
        return avio_.get();
    }

private:
    static int readPacket(void* opaque, u8* buf, int size);
    static i64 seek(void* opaque, i64 offset, int whence);

    std::shared_ptr<const std::vector<u8>> data_;
    usize pos_{0};
    AVIOContextPtr avio_;
};

// Demuxer opened on a MediaSource; the reader (if any) outlives the context
struct InputContext {
    std::unique_ptr<AvioMemoryReader> reader;
    AVInputContextPtr format;
};

// Opens and probes a source. Failures carry ErrorCode::AssetLoad.
Result<InputContext> openInput(const MediaSource& source);

// Opens a decoder for the given stream
Result<AVCodecContextPtr> openDecoder(AVFormatContext* fmt, int streamIndex);

// True when a failed av_read_frame() marks the end of the input rather than
// an I/O or demux error
bool readEndedCleanly(const AVFormatContext* fmt, int readResult);

// Idempotent avformat_network_init()
void ensureNetworkInit();

} // namespace rs

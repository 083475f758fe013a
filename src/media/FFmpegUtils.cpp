#include "FFmpegUtils.hpp"
#include <algorithm>
#include <cstring>
#include <mutex>

namespace rs {

namespace {
constexpr int kAvioBufferSize = 64 * 1024;
} // namespace

std::string ffmpegError(int errnum) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(errnum, buf, sizeof(buf));
    return buf;
}

bool readEndedCleanly(const AVFormatContext* fmt, int readResult) {
    if (readResult == AVERROR_EOF) {
        return true;
    }
    // Some demuxers report a short final read instead of AVERROR_EOF
    return fmt && fmt->pb && avio_feof(fmt->pb) && fmt->pb->error == 0;
}

void ensureNetworkInit() {
    static std::once_flag once;
    std::call_once(once, [] { avformat_network_init(); });
}

AvioMemoryReader::AvioMemoryReader(std::shared_ptr<const std::vector<u8>> data)
    : data_(std::move(data)) {
    auto* buffer = static_cast<u8*>(av_malloc(kAvioBufferSize));
    if (!buffer) {
        return;
    }
    avio_.reset(avio_alloc_context(buffer,
                                   kAvioBufferSize,
                                   0,
                                   this,
                                   &AvioMemoryReader::readPacket,
                                   nullptr,
                                   &AvioMemoryReader::seek));
    if (!avio_) {
        av_free(buffer);
    }
}

int AvioMemoryReader::readPacket(void* opaque, u8* buf, int size) {
    auto* self = static_cast<AvioMemoryReader*>(opaque);
    const auto& data = *self->data_;
    if (self->pos_ >= data.size()) {
        return AVERROR_EOF;
    }
    auto n = std::min<usize>(static_cast<usize>(size), data.size() - self->pos_);
    std::memcpy(buf, data.data() + self->pos_, n);
    self->pos_ += n;
    return static_cast<int>(n);
}

i64 AvioMemoryReader::seek(void* opaque, i64 offset, int whence) {
    auto* self = static_cast<AvioMemoryReader*>(opaque);
    const auto size = static_cast<i64>(self->data_->size());

    if (whence & AVSEEK_SIZE) {
        return size;
    }

    i64 target = 0;
    switch (whence & ~AVSEEK_FORCE) {
    case SEEK_SET:
        target = offset;
        break;
    case SEEK_CUR:
        target = static_cast<i64>(self->pos_) + offset;
        break;
    case SEEK_END:
        target = size + offset;
        break;
    default:
        return AVERROR(EINVAL);
    }
    if (target < 0 || target > size) {
        return AVERROR(EINVAL);
    }
    self->pos_ = static_cast<usize>(target);
    return target;
}

Result<InputContext> openInput(const MediaSource& source) {
    auto fail = [&](std::string msg) {
        Error e(ErrorCode::AssetLoad, std::move(msg));
        e.forAsset(source.describe());
        return Result<InputContext>::err(std::move(e));
    };

    if (source.empty()) {
        return fail("Empty media source");
    }

    InputContext input;
    AVFormatContext* ctx = avformat_alloc_context();
    if (!ctx) {
        return fail("Failed to allocate format context");
    }

    std::string url;
    if (source.inMemory()) {
        input.reader = std::make_unique<AvioMemoryReader>(source.bytes());
        if (!input.reader->context()) {
            avformat_free_context(ctx);
            return fail("Failed to allocate memory reader");
        }
        ctx->pb = input.reader->context();
        ctx->flags |= AVFMT_FLAG_CUSTOM_IO;
    } else {
        if (source.isRemote()) {
            ensureNetworkInit();
        }
        url = source.isRemote() ? source.uri() : source.localPath();
    }

    // avformat_open_input frees ctx on failure
    int ret = avformat_open_input(
            &ctx, url.empty() ? nullptr : url.c_str(), nullptr, nullptr);
    if (ret < 0) {
        return fail("Could not open: " + ffmpegError(ret));
    }
    input.format.reset(ctx);

    ret = avformat_find_stream_info(input.format.get(), nullptr);
    if (ret < 0) {
        return fail("Could not read stream info: " + ffmpegError(ret));
    }

    return Result<InputContext>::ok(std::move(input));
}

Result<AVCodecContextPtr> openDecoder(AVFormatContext* fmt, int streamIndex) {
    AVCodecParameters* params = fmt->streams[streamIndex]->codecpar;
    const AVCodec* codec = avcodec_find_decoder(params->codec_id);
    if (!codec) {
        return Result<AVCodecContextPtr>::err(
                ErrorCode::AssetLoad,
                std::string("No decoder for codec ") +
                        avcodec_get_name(params->codec_id));
    }

    AVCodecContextPtr ctx(avcodec_alloc_context3(codec));
    if (!ctx) {
        return Result<AVCodecContextPtr>::err(
                ErrorCode::AssetLoad, "Could not allocate codec context");
    }

    int ret = avcodec_parameters_to_context(ctx.get(), params);
    if (ret < 0) {
        return Result<AVCodecContextPtr>::err(
                ErrorCode::AssetLoad,
                "Could not copy codec params: " + ffmpegError(ret));
    }
    ctx->pkt_timebase = fmt->streams[streamIndex]->time_base;

    ret = avcodec_open2(ctx.get(), codec, nullptr);
    if (ret < 0) {
        return Result<AVCodecContextPtr>::err(
                ErrorCode::AssetLoad, "Could not open codec: " + ffmpegError(ret));
    }
    return Result<AVCodecContextPtr>::ok(std::move(ctx));
}

} // namespace rs

#include "AudioDecoder.hpp"
#include <algorithm>
#include "FFmpegUtils.hpp"
#include "core/Logger.hpp"

namespace rs {

Result<PcmBuffer> AudioDecoder::decode(const MediaSource& source) {
    auto fail = [&](std::string msg) {
        Error e(ErrorCode::AssetLoad, std::move(msg));
        e.forAsset(source.describe());
        return Result<PcmBuffer>::err(std::move(e));
    };

    auto input = openInput(source);
    if (!input) {
        return Result<PcmBuffer>::err(input.error());
    }
    AVFormatContext* fmt = input->format.get();

    const int stream = av_find_best_stream(fmt, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (stream < 0) {
        return fail("No audio track");
    }

    auto decoder = openDecoder(fmt, stream);
    if (!decoder) {
        return Result<PcmBuffer>::err(decoder.error());
    }
    AVCodecContext* dec = decoder->get();

    if (dec->sample_rate <= 0) {
        return fail("Audio track has no sample rate");
    }

    const int channels = std::max(1, dec->ch_layout.nb_channels);
    AVChannelLayout inLayout{};
    if (dec->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC ||
        dec->ch_layout.nb_channels == 0) {
        av_channel_layout_default(&inLayout, channels);
    } else {
        av_channel_layout_copy(&inLayout, &dec->ch_layout);
    }
    AVChannelLayout outLayout{};
    av_channel_layout_default(&outLayout, channels);

    SwrContext* rawSwr = nullptr;
    int ret = swr_alloc_set_opts2(&rawSwr,
                                  &outLayout,
                                  AV_SAMPLE_FMT_S16,
                                  dec->sample_rate,
                                  &inLayout,
                                  dec->sample_fmt,
                                  dec->sample_rate,
                                  0,
                                  nullptr);
    SwrContextPtr swr(rawSwr);
    av_channel_layout_uninit(&inLayout);
    av_channel_layout_uninit(&outLayout);
    if (ret < 0 || (ret = swr_init(swr.get())) < 0) {
        return fail("Could not configure resampler: " + ffmpegError(ret));
    }

    PcmBuffer pcm;
    pcm.sampleRate = static_cast<u32>(dec->sample_rate);
    pcm.channels = static_cast<u32>(channels);

    auto append = [&](const u8** in, int inCount) -> int {
        const int capacity = swr_get_out_samples(swr.get(), inCount);
        if (capacity <= 0) {
            return 0;
        }
        const usize old = pcm.samples.size();
        pcm.samples.resize(old + static_cast<usize>(capacity) * channels);
        u8* out = reinterpret_cast<u8*>(pcm.samples.data() + old);
        int got = swr_convert(swr.get(), &out, capacity, in, inCount);
        pcm.samples.resize(old + static_cast<usize>(std::max(0, got)) * channels);
        return got;
    };

    AVPacketPtr packet(av_packet_alloc());
    AVFramePtr frame(av_frame_alloc());
    if (!packet || !frame) {
        return fail("Out of memory");
    }

    auto receiveAll = [&]() -> int {
        while (true) {
            int r = avcodec_receive_frame(dec, frame.get());
            if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) {
                return 0;
            }
            if (r < 0) {
                return r;
            }
            int got = append(const_cast<const u8**>(frame->extended_data),
                             frame->nb_samples);
            av_frame_unref(frame.get());
            if (got < 0) {
                return got;
            }
        }
    };

    while ((ret = av_read_frame(fmt, packet.get())) >= 0) {
        if (packet->stream_index == stream) {
            ret = avcodec_send_packet(dec, packet.get());
            if (ret < 0 && ret != AVERROR(EAGAIN)) {
                LOG_DEBUG("Dropped corrupt audio packet: {}", ffmpegError(ret));
            }
            if ((ret = receiveAll()) < 0) {
                av_packet_unref(packet.get());
                return fail("Decode failed: " + ffmpegError(ret));
            }
        }
        av_packet_unref(packet.get());
    }
    if (!readEndedCleanly(fmt, ret)) {
        return fail("Read error: " + ffmpegError(ret));
    }

    avcodec_send_packet(dec, nullptr);
    if ((ret = receiveAll()) < 0) {
        return fail("Decode failed: " + ffmpegError(ret));
    }
    if (append(nullptr, 0) < 0) {
        return fail("Resampler flush failed");
    }

    LOG_DEBUG("Decoded {} frames ({:.2f}s) at {} Hz x{} from {}",
              pcm.frames(),
              pcm.seconds(),
              pcm.sampleRate,
              pcm.channels,
              source.describe());
    return Result<PcmBuffer>::ok(std::move(pcm));
}

} // namespace rs

#include "CodecNegotiator.hpp"
#include "core/Logger.hpp"
#include "media/FFmpegUtils.hpp"

namespace rs {

bool FFmpegCodecProbe::isSupported(const CodecCandidate& candidate) const {
    const AVOutputFormat* muxer =
            av_guess_format(candidate.container.c_str(), nullptr, nullptr);
    if (!muxer) {
        return false;
    }

    const AVCodec* video = avcodec_find_encoder_by_name(candidate.videoCodec.c_str());
    const AVCodec* audio = avcodec_find_encoder_by_name(candidate.audioCodec.c_str());
    if (!video || !audio) {
        return false;
    }
    if (video->type != AVMEDIA_TYPE_VIDEO || audio->type != AVMEDIA_TYPE_AUDIO) {
        return false;
    }

    // 1 = supported; negative = muxer cannot tell, which only happens for
    // muxers without a codec tag table and is accepted
    return avformat_query_codec(muxer, video->id, FF_COMPLIANCE_NORMAL) != 0 &&
           avformat_query_codec(muxer, audio->id, FF_COMPLIANCE_NORMAL) != 0;
}

CodecNegotiator::CodecNegotiator(std::shared_ptr<const CodecProbe> probe)
    : probe_(std::move(probe)) {
}

Result<CodecCandidate> CodecNegotiator::negotiate(
        const std::vector<CodecCandidate>& candidates) const {
    for (const auto& candidate : candidates) {
        if (probe_->isSupported(candidate)) {
            LOG_INFO("Using output type: {} ({} {}/{})",
                     candidate.mime,
                     candidate.container,
                     candidate.videoCodec,
                     candidate.audioCodec);
            return Result<CodecCandidate>::ok(candidate);
        }
        LOG_DEBUG("Output type not supported: {}", candidate.mime);
    }
    return Result<CodecCandidate>::err(
            ErrorCode::CodecNegotiation,
            "None of the " + std::to_string(candidates.size()) +
                    " output container/codec candidates is supported");
}

} // namespace rs

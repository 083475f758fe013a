#include "VoiceNormalizer.hpp"
#include "audio/PcmEncoder.hpp"
#include "core/Logger.hpp"
#include "media/AudioDecoder.hpp"

namespace rs {

VoiceNormalizer::VoiceNormalizer(VoiceConverter& converter,
                                 AudioExtractor& extractor,
                                 NormalizationOptions options,
                                 MediaFetcher fetcher)
    : converter_(converter),
      extractor_(extractor),
      options_(std::move(options)),
      fetcher_(fetcher) {
}

Result<std::vector<u8>> VoiceNormalizer::speechToWav(const MediaAssetHandle& speech) const {
    auto bytes = fetcher_.fetch(speech.source());
    if (!bytes) {
        return Result<std::vector<u8>>::err(bytes.error());
    }
    // Already 16-bit PCM WAV: send unchanged
    if (PcmEncoder::decode(*bytes)) {
        return Result<std::vector<u8>>::ok(std::move(*bytes));
    }
    auto pcm = AudioDecoder::decode(MediaSource::fromBytes(
            std::move(*bytes), speech.source().mimeType(), MediaKind::Audio));
    if (!pcm) {
        return Result<std::vector<u8>>::err(pcm.error());
    }
    return PcmEncoder::encode(*pcm);
}

Result<MediaSource> VoiceNormalizer::normalize(const MediaAssetHandle& speech,
                                               const MediaAssetHandle* video) {
    auto input = video ? extractor_.extract(*video) : speechToWav(speech);
    if (!input) {
        Error e = input.error();
        e.code = ErrorCode::Normalization;
        e.message = "Could not prepare conversion input: " + e.message;
        return Result<MediaSource>::err(std::move(e));
    }

    auto converted = converter_.convert(*input, options_);
    if (!converted) {
        return Result<MediaSource>::err(converted.error());
    }
    if (converted->empty()) {
        return Result<MediaSource>::err(ErrorCode::Normalization,
                                        "Voice conversion returned no audio");
    }

    LOG_DEBUG("Normalized {} ({} -> {} bytes)",
              video ? video->describe() : speech.describe(),
              input->size(),
              converted->size());
    return Result<MediaSource>::ok(
            MediaSource::fromBytes(std::move(*converted), "audio/wav", MediaKind::Audio));
}

} // namespace rs

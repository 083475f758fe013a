#pragma once
// VoiceNormalizer.hpp - Per-segment voice-timbre normalization
// Builds the WAV input for one segment, sends it through a VoiceConverter
// and wraps the reply as an in-memory audio source.

#include "VoiceConverter.hpp"
#include "audio/AudioExtractor.hpp"
#include "media/MediaAssetHandle.hpp"
#include "media/MediaFetcher.hpp"

namespace rs {

class VoiceNormalizer {
public:
    VoiceNormalizer(VoiceConverter& converter,
                    AudioExtractor& extractor,
                    NormalizationOptions options,
                    MediaFetcher fetcher = MediaFetcher());

    // When video is given its audio track is the conversion input, otherwise
    // the speech audio is. The caller keeps the original audio on failure.
    Result<MediaSource> normalize(const MediaAssetHandle& speech,
                                  const MediaAssetHandle* video);

    // Speech audio re-encoded as 16-bit PCM WAV
    Result<std::vector<u8>> speechToWav(const MediaAssetHandle& speech) const;

private:
    VoiceConverter& converter_;
    AudioExtractor& extractor_;
    NormalizationOptions options_;
    MediaFetcher fetcher_;
};

} // namespace rs

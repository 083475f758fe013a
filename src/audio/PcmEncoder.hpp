/**
 * @file PcmEncoder.hpp
 * @brief Raw PCM to RIFF/WAVE container encoding.
 *
 * Produces the canonical 44-byte-header layout:
 *
 *   "RIFF" <36 + dataSize> "WAVE"
 *   "fmt " 16  format=1 channels rate byteRate blockAlign bits=16
 *   "data" <dataSize> interleaved little-endian int16 samples
 *
 * Output is a pure function of (samples, channels, sampleRate).
 */

#pragma once
#include <span>
#include <vector>
#include "media/AudioDecoder.hpp"
#include "media/MediaSource.hpp"
#include "util/Result.hpp"

namespace rs {

class PcmEncoder {
public:
    static constexpr usize kHeaderSize = 44;

    static Result<std::vector<u8>> encode(std::span<const i16> samples,
                                          u32 channels,
                                          u32 sampleRate);
    static Result<std::vector<u8>> encode(const PcmBuffer& pcm) {
        return encode(pcm.samples, pcm.channels, pcm.sampleRate);
    }

    // Same bytes wrapped as an in-memory "audio/wav" source
    static Result<MediaSource> toMediaSource(std::span<const i16> samples,
                                             u32 channels,
                                             u32 sampleRate);

    // Reads a 16-bit PCM WAV back, skipping chunks other than fmt and data
    static Result<PcmBuffer> decode(std::span<const u8> wav);

    // Clamps to [-1, 1]; negative values scale by 32768, positive by 32767
    static i16 floatToPcm16(f32 sample);
    static std::vector<i16> floatToPcm16(std::span<const f32> samples);
};

} // namespace rs

#pragma once
// AudioDecoder.hpp - Whole-file decode of an audio track to 16-bit PCM
// Output keeps the source's sample rate and channel count.

#include <vector>
#include "MediaSource.hpp"
#include "util/Result.hpp"

namespace rs {

struct PcmBuffer {
    std::vector<i16> samples; // interleaved
    u32 sampleRate{0};
    u32 channels{0};

    usize frames() const {
        return channels ? samples.size() / channels : 0;
    }
    f64 seconds() const {
        return sampleRate ? static_cast<f64>(frames()) / sampleRate : 0.0;
    }
};

class AudioDecoder {
public:
    // Fails with ErrorCode::AssetLoad when the source cannot be opened,
    // has no audio stream, or a decode error occurs
    static Result<PcmBuffer> decode(const MediaSource& source);
};

} // namespace rs

#pragma once
// CaptureSink.hpp - Destination for the composited frames and mixed audio
// A sink is opened once, fed frame by frame, then either finished (yielding
// the encoded bytes) or discarded. Failures carry ErrorCode::Capture.

#include <QImage>
#include <span>
#include <vector>
#include "EncoderSettings.hpp"
#include "util/Result.hpp"

namespace rs {

class CaptureSink {
public:
    virtual ~CaptureSink() = default;

    virtual Result<void> open(const EncoderSettings& settings) = 0;
    virtual Result<void> writeVideoFrame(const QImage& frame) = 0;
    // Interleaved float samples in the settings' audio format
    virtual Result<void> writeAudio(std::span<const f32> samples) = 0;
    virtual Result<std::vector<u8>> finish() = 0;
    // Drops everything written so far; safe to call in any state
    virtual void discard() = 0;
};

} // namespace rs

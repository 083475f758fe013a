#pragma once
// CaptureSession.hpp - One recording: the negotiated format plus its sink
// Every sink failure becomes ErrorCode::Capture and discards the output.

#include <memory>
#include "CaptureSink.hpp"
#include "EncoderSettings.hpp"

namespace rs {

class CaptureSession {
public:
    explicit CaptureSession(std::unique_ptr<CaptureSink> sink);
    ~CaptureSession();

    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

    Result<void> start(const EncoderSettings& settings);

    // One composited frame and the audio that plays during it
    Result<void> pushFrame(const QImage& frame, std::span<const f32> audio);

    Result<std::vector<u8>> finish();
    void abort();

    bool isActive() const {
        return active_;
    }
    const EncoderSettings& settings() const {
        return settings_;
    }
    u64 framesPushed() const {
        return frames_;
    }
    u64 samplesPushed() const {
        return samples_;
    }

private:
    Result<void> fail(Error error);

    std::unique_ptr<CaptureSink> sink_;
    EncoderSettings settings_;
    bool active_{false};
    u64 frames_{0};
    u64 samples_{0};
};

} // namespace rs

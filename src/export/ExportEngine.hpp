/**
 * @file ExportEngine.hpp
 * @brief Turns an ordered list of segments into one synchronized recording.
 *
 * run() executes the whole pipeline on the calling thread:
 *
 *  1. preparing    readiness filter, codec negotiation, backdrop
 *  2. loading      one fresh MediaAssetHandle per asset, durations resolved
 *  3. normalizing  optional voice conversion per segment (failures recorded,
 *                  original audio kept)
 *  4. compositing  per segment: prime, play, paint frames until both clocks
 *                  complete, feed each frame and its audio to the capture
 *  5. finalizing   the capture is closed and read back
 *
 * Only one run may be active per process; a concurrent run() fails with
 * ErrorCode::Busy. requestStop() lets the current segment finish, then the
 * capture is discarded and run() returns ErrorCode::Cancelled.
 *
 * Collaborators are injected through ExportServices so that tests can
 * replace media decoding, codec probing, capture and voice conversion.
 */

#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include "ExportTypes.hpp"
#include "audio/AudioExtractor.hpp"
#include "capture/CaptureSink.hpp"
#include "capture/CodecNegotiator.hpp"
#include "media/MediaElementFactory.hpp"
#include "normalize/VoiceConverter.hpp"
#include "render/FrameClock.hpp"
#include "util/Result.hpp"
#include "util/Signal.hpp"

namespace rs {

struct ExportServices {
    std::shared_ptr<MediaElementFactory> mediaFactory;
    std::shared_ptr<const CodecProbe> codecProbe;
    std::function<std::unique_ptr<CaptureSink>()> sinkFactory;
    // Null disables normalization even when the request asks for it
    std::shared_ptr<VoiceConverter> voiceConverter;
    // Null means fast decode then real-time capture
    std::shared_ptr<AudioExtractor> extractor;
    // Null means real-time pacing when the settings ask for it
    std::function<std::unique_ptr<FrameClock>()> clockFactory;

    // FFmpeg media, FFmpeg probe and sink, HTTP voice conversion
    static ExportServices defaults();
};

class ExportEngine {
public:
    explicit ExportEngine(ExportServices services);
    ~ExportEngine();

    ExportEngine(const ExportEngine&) = delete;
    ExportEngine& operator=(const ExportEngine&) = delete;

    Result<CaptureOutput> run(const ExportRequest& request);

    // Finish the current segment, then cancel
    void requestStop() {
        stopRequested_ = true;
    }

    static bool isBusy() {
        return busy_.load();
    }

    Signal<const ExportProgress&> progressChanged;

private:
    struct Impl;

    void report(ExportStage stage,
                f64 percent,
                std::optional<usize> current = std::nullopt,
                std::optional<usize> total = std::nullopt);

    ExportServices services_;
    std::atomic<bool> stopRequested_{false};

    static std::atomic<bool> busy_;
};

} // namespace rs

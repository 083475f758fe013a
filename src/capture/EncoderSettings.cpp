#include "EncoderSettings.hpp"

namespace rs {

EncoderSettings EncoderSettings::from(const CodecCandidate& candidate,
                                      const ExportConfig& exportCfg,
                                      const CaptureConfig& captureCfg) {
    EncoderSettings s;
    s.candidate = candidate;
    s.width = exportCfg.width;
    s.height = exportCfg.height;
    s.fps = exportCfg.fps;
    s.videoBitrate = captureCfg.videoBitrate;
    s.preset = captureCfg.preset;
    s.audio.sampleRate = captureCfg.sampleRate;
    s.audio.channels = captureCfg.channels;
    s.audioBitrate = captureCfg.audioBitrate;
    return s;
}

Result<void> EncoderSettings::validate() const {
    if (width == 0 || height == 0 || width % 2 || height % 2) {
        return Result<void>::err(ErrorCode::InvalidInput,
                                 "Output size must be non-zero and even");
    }
    if (fps == 0) {
        return Result<void>::err(ErrorCode::InvalidInput, "Frame rate must be positive");
    }
    if (audio.sampleRate == 0 || audio.channels == 0) {
        return Result<void>::err(ErrorCode::InvalidInput, "Invalid audio format");
    }
    if (candidate.container.empty() || candidate.videoCodec.empty() ||
        candidate.audioCodec.empty()) {
        return Result<void>::err(ErrorCode::InvalidInput, "Incomplete codec candidate");
    }
    return Result<void>::ok();
}

} // namespace rs

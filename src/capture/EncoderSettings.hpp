#pragma once
// EncoderSettings.hpp - Everything a capture sink needs to open an output

#include <filesystem>
#include <string>
#include "core/ConfigData.hpp"
#include "media/MediaElement.hpp"
#include "util/Result.hpp"

namespace rs {

struct EncoderSettings {
    CodecCandidate candidate;

    u32 width{720};
    u32 height{1280};
    u32 fps{30};
    u32 videoBitrate{8000}; // kbps
    std::string preset{"veryfast"};

    AudioFormat audio;
    u32 audioBitrate{192}; // kbps

    fs::path outputPath;

    static EncoderSettings from(const CodecCandidate& candidate,
                                const ExportConfig& exportCfg,
                                const CaptureConfig& captureCfg);

    Result<void> validate() const;
};

} // namespace rs

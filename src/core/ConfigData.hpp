/**
 * @file ConfigData.hpp
 * @brief Configuration data structures.
 *
 * Plain structs holding configuration values, kept apart from the logic
 * classes so that engine headers can include them without pulling in toml++.
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "util/Types.hpp"

namespace rs {

namespace fs = std::filesystem;

// One entry of the output container/codec preference list
struct CodecCandidate {
    std::string mime;
    std::string container;  // FFmpeg muxer short name
    std::string videoCodec; // FFmpeg encoder name
    std::string audioCodec; // FFmpeg encoder name
    std::string extension;

    bool operator==(const CodecCandidate&) const = default;
};

// Most compatible single-file pairs first. The last entry uses FFmpeg's
// built-in encoders only, so negotiation against it cannot fail.
inline std::vector<CodecCandidate> defaultCodecCandidates() {
    return {
            {"video/mp4;codecs=avc1.42E01E,mp4a.40.2",
             "mp4",
             "libx264",
             "aac",
             "mp4"},
            {"video/mp4;codecs=h264,aac", "mp4", "libopenh264", "aac", "mp4"},
            {"video/webm;codecs=vp9,opus",
             "webm",
             "libvpx-vp9",
             "libopus",
             "webm"},
            {"video/webm;codecs=vp8,opus", "webm", "libvpx", "libopus", "webm"},
            {"video/webm", "webm", "libvpx", "libvorbis", "webm"},
            {"video/mp4", "mp4", "mpeg4", "aac", "mp4"},
    };
}

// Composition and timing
struct ExportConfig {
    u32 width{720};
    u32 height{1280};
    u32 fps{30};
    Color background{Color::black()};
    f64 completionTolerance{0.05};
    bool realtime{true};
    bool videoAudioReplacesSpeech{true};
    f64 durationDivergenceWarning{0.5};
    fs::path outputDirectory;
    std::string filename{"rehearsal-composed-{timestamp}"};
};

// Recorder settings shared by every codec candidate
struct CaptureConfig {
    u32 videoBitrate{8000}; // kbps
    std::string preset{"veryfast"};
    u32 audioBitrate{192}; // kbps
    u32 sampleRate{48000};
    u32 channels{2};
    std::vector<CodecCandidate> candidates{defaultCodecCandidates()};
};

// Voice-timbre normalization endpoint (RVC voice2voice)
struct NormalizationConfig {
    bool enabled{false};
    std::string apiUrl;
    std::string modelName;
    std::string f0Method{"rmvpe"};
    f64 indexRate{0.66};
    u32 timeoutMs{120000};

    bool isUsable() const {
        return enabled && !apiUrl.empty() && !modelName.empty();
    }
};

} // namespace rs

/**
 * @file ExportTypes.hpp
 * @brief Inputs, progress reports and outputs of an export run.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "Segment.hpp"
#include "core/ConfigData.hpp"
#include "media/MediaSource.hpp"
#include "normalize/VoiceConverter.hpp"

namespace rs {

enum class ExportStage { Preparing, Loading, Normalizing, Compositing, Finalizing, Complete };

const char* exportStageName(ExportStage stage);

struct ExportProgress {
    ExportStage stage{ExportStage::Preparing};
    f64 percent{0.0}; // 0..100
    std::optional<usize> currentSegment; // 1-based
    std::optional<usize> totalSegments;
};

struct SegmentTiming {
    usize index{0}; // position among exported segments
    std::string id;
    f64 speechDuration{0.0};
    std::optional<f64> normalizedDuration;
    std::optional<f64> videoDuration; // only when the video is shown
    f64 duration{0.0};                // max(effective audio, video)
    u64 frames{0};
};

struct NormalizationFailure {
    usize segmentIndex{0};
    std::string message;
};

struct DurationWarning {
    usize segmentIndex{0};
    f64 originalDuration{0.0};
    f64 normalizedDuration{0.0};
};

struct ExportReport {
    std::vector<SegmentTiming> segments;
    std::vector<NormalizationFailure> normalizationFailures;
    std::vector<DurationWarning> durationWarnings;
    u64 framesWritten{0};
    u32 fps{0};

    // Sum of the planned segment durations
    f64 totalDuration() const;
    // Length of the recording actually written (framesWritten / fps). Each
    // segment may stop up to the completion tolerance before its planned end.
    f64 renderedDuration() const;
};

struct CaptureOutput {
    std::vector<u8> bytes;
    std::string mimeType; // negotiated candidate
    std::string extension;
    ExportReport report;

    // "rehearsal-composed-<epochMs>.<ext>" for the default pattern
    std::string filename(const std::string& pattern, i64 epochMs) const;
};

// Snapshot of the configuration one export runs with
struct ExportSettings {
    ExportConfig exporting;
    CaptureConfig capture;

    static ExportSettings fromConfig();
};

struct ExportRequest {
    std::vector<Segment> segments;
    MediaSource backdrop; // static image shown when no video is active
    std::optional<NormalizationOptions> normalization;
    ExportSettings settings;
};

} // namespace rs

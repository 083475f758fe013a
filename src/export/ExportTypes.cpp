#include "ExportTypes.hpp"
#include <numeric>
#include "core/Config.hpp"

namespace rs {

const char* exportStageName(ExportStage stage) {
    switch (stage) {
    case ExportStage::Preparing:
        return "preparing";
    case ExportStage::Loading:
        return "loading";
    case ExportStage::Normalizing:
        return "normalizing";
    case ExportStage::Compositing:
        return "compositing";
    case ExportStage::Finalizing:
        return "finalizing";
    case ExportStage::Complete:
        return "complete";
    }
    return "preparing";
}

f64 ExportReport::totalDuration() const {
    return std::accumulate(segments.begin(),
                           segments.end(),
                           0.0,
                           [](f64 acc, const SegmentTiming& t) { return acc + t.duration; });
}

f64 ExportReport::renderedDuration() const {
    if (fps == 0) {
        return 0.0;
    }
    return static_cast<f64>(framesWritten) / fps;
}

std::string CaptureOutput::filename(const std::string& pattern, i64 epochMs) const {
    std::string name = pattern.empty() ? "rehearsal-composed-{timestamp}" : pattern;
    const std::string token = "{timestamp}";
    if (auto pos = name.find(token); pos != std::string::npos) {
        name.replace(pos, token.size(), std::to_string(epochMs));
    }
    return name + "." + (extension.empty() ? "bin" : extension);
}

ExportSettings ExportSettings::fromConfig() {
    const Config& cfg = CONFIG;
    return {cfg.exporting(), cfg.capture()};
}

} // namespace rs

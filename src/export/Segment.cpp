#include "Segment.hpp"
#include <algorithm>

namespace rs {

const char* gestureTypeName(GestureType type) {
    switch (type) {
    case GestureType::None:
        return "none";
    case GestureType::Beat:
        return "beat";
    case GestureType::Deictic:
        return "deictic";
    case GestureType::Iconic:
        return "iconic";
    case GestureType::Metaphoric:
        return "metaphoric";
    }
    return "none";
}

std::optional<GestureType> parseGestureType(std::string_view name) {
    for (auto t : {GestureType::None,
                   GestureType::Beat,
                   GestureType::Deictic,
                   GestureType::Iconic,
                   GestureType::Metaphoric}) {
        if (name == gestureTypeName(t)) {
            return t;
        }
    }
    return std::nullopt;
}

const char* assetStatusName(AssetStatus status) {
    switch (status) {
    case AssetStatus::Idle:
        return "idle";
    case AssetStatus::Generating:
        return "generating";
    case AssetStatus::Completed:
        return "completed";
    case AssetStatus::Error:
        return "error";
    }
    return "idle";
}

std::optional<AssetStatus> parseAssetStatus(std::string_view name) {
    for (auto s : {AssetStatus::Idle,
                   AssetStatus::Generating,
                   AssetStatus::Completed,
                   AssetStatus::Error}) {
        if (name == assetStatusName(s)) {
            return s;
        }
    }
    return std::nullopt;
}

bool isExportReady(const Segment& segment) {
    return segment.audioStatus == AssetStatus::Completed && segment.audio &&
           !segment.audio->empty();
}

bool canExport(const std::vector<Segment>& segments) {
    return std::any_of(segments.begin(), segments.end(), isExportReady);
}

bool expectsVisual(const Segment& segment) {
    return segment.gesture != GestureType::None &&
           segment.videoStatus == AssetStatus::Completed && segment.video &&
           !segment.video->empty();
}

} // namespace rs

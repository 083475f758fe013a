#pragma once
// Segment.hpp - One unit of the rehearsal timeline as handed to the exporter

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "media/MediaSource.hpp"

namespace rs {

enum class GestureType { None, Beat, Deictic, Iconic, Metaphoric };

enum class AssetStatus { Idle, Generating, Completed, Error };

const char* gestureTypeName(GestureType type);
std::optional<GestureType> parseGestureType(std::string_view name);

const char* assetStatusName(AssetStatus status);
std::optional<AssetStatus> parseAssetStatus(std::string_view name);

struct Segment {
    std::string id;
    std::string text;
    GestureType gesture{GestureType::None};
    std::string gestureDescription;

    AssetStatus audioStatus{AssetStatus::Idle};
    AssetStatus videoStatus{AssetStatus::Idle};

    std::optional<MediaSource> audio; // speech
    std::optional<MediaSource> video;
};

// Completed speech audio with a source
bool isExportReady(const Segment& segment);

// At least one segment is export-ready
bool canExport(const std::vector<Segment>& segments);

// A video is expected and available; loading it decides the rest
bool expectsVisual(const Segment& segment);

} // namespace rs

#include "ManifestLoader.hpp"
#include <toml++/toml.h>
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace rs {

namespace {

namespace fs = std::filesystem;

MediaSource resolveSource(const std::string& ref, MediaKind kind, const fs::path& baseDir) {
    const bool isUrl = ref.find("://") != std::string::npos;
    if (isUrl) {
        return MediaSource::fromUri(ref, kind);
    }
    fs::path p = file::expandHome(ref);
    if (p.is_relative()) {
        p = baseDir / p;
    }
    return MediaSource::fromUri(p.lexically_normal().string(), kind);
}

Result<Segment> parseSegment(const toml::table& tbl, usize index, const fs::path& baseDir) {
    auto fail = [index](std::string msg) {
        Error e(ErrorCode::InvalidInput, std::move(msg));
        e.atSegment(index);
        return Result<Segment>::err(std::move(e));
    };

    Segment seg;
    seg.id = tbl["id"].value_or(std::string("segment-") + std::to_string(index + 1));
    seg.text = tbl["text"].value_or(std::string());
    seg.gestureDescription = tbl["gesture_description"].value_or(std::string());

    const std::string gesture = tbl["gesture"].value_or(std::string("none"));
    auto g = parseGestureType(gesture);
    if (!g) {
        return fail("Unknown gesture type '" + gesture + "'");
    }
    seg.gesture = *g;

    if (auto audio = tbl["audio"].value<std::string>(); audio && !audio->empty()) {
        seg.audio = resolveSource(*audio, MediaKind::Audio, baseDir);
        seg.audioStatus = AssetStatus::Completed;
    }
    if (auto video = tbl["video"].value<std::string>(); video && !video->empty()) {
        seg.video = resolveSource(*video, MediaKind::Video, baseDir);
        seg.videoStatus = AssetStatus::Completed;
    }

    if (auto s = tbl["audio_status"].value<std::string>()) {
        auto st = parseAssetStatus(*s);
        if (!st) {
            return fail("Unknown audio status '" + *s + "'");
        }
        seg.audioStatus = *st;
    }
    if (auto s = tbl["video_status"].value<std::string>()) {
        auto st = parseAssetStatus(*s);
        if (!st) {
            return fail("Unknown video status '" + *s + "'");
        }
        seg.videoStatus = *st;
    }
    return Result<Segment>::ok(std::move(seg));
}

Result<Manifest> fromTable(const toml::table& tbl, const fs::path& baseDir) {
    Manifest manifest;
    if (auto backdrop = tbl["backdrop"].value<std::string>(); backdrop && !backdrop->empty()) {
        manifest.backdrop = resolveSource(*backdrop, MediaKind::Image, baseDir);
    }

    auto arr = tbl["segment"].as_array();
    if (!arr) {
        return Result<Manifest>::err(ErrorCode::InvalidInput, "Manifest has no [[segment]] entries");
    }

    for (usize i = 0; i < arr->size(); ++i) {
        auto t = arr->get(i)->as_table();
        if (!t) {
            Error e(ErrorCode::InvalidInput, "Segment entry is not a table");
            e.atSegment(i);
            return Result<Manifest>::err(std::move(e));
        }
        auto seg = parseSegment(*t, i, baseDir);
        if (!seg) {
            return Result<Manifest>::err(seg.error());
        }
        manifest.segments.push_back(std::move(*seg));
    }
    return Result<Manifest>::ok(std::move(manifest));
}

} // namespace

Result<Manifest> ManifestLoader::load(const fs::path& path) {
    try {
        auto tbl = toml::parse_file(path.string());
        auto manifest = fromTable(tbl, path.parent_path());
        if (manifest) {
            LOG_INFO("Manifest loaded from {}: {} segments",
                     path.string(),
                     manifest->segments.size());
        }
        return manifest;
    } catch (const toml::parse_error& err) {
        return Result<Manifest>::err(ErrorCode::InvalidInput,
                                     std::string("Manifest parse error: ") + err.what());
    }
}

Result<Manifest> ManifestLoader::parse(std::string_view text, const fs::path& baseDir) {
    try {
        auto tbl = toml::parse(text);
        return fromTable(tbl, baseDir);
    } catch (const toml::parse_error& err) {
        return Result<Manifest>::err(ErrorCode::InvalidInput,
                                     std::string("Manifest parse error: ") + err.what());
    }
}

} // namespace rs

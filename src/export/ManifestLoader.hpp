#pragma once
// ManifestLoader.hpp - Reads a rehearsal manifest (TOML) into segments
//
//   backdrop = "character.png"          # optional
//
//   [[segment]]
//   id = "s1"
//   text = "Good evening."
//   gesture = "beat"                    # none|beat|deictic|iconic|metaphoric
//   audio = "s1.wav"                    # path or URL
//   audio_status = "completed"          # defaults to completed when audio is set
//   video = "s1.mp4"
//   video_status = "completed"
//
// Relative paths are resolved against the manifest's directory.

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>
#include "Segment.hpp"
#include "util/Result.hpp"

namespace rs {

struct Manifest {
    std::vector<Segment> segments;
    std::optional<MediaSource> backdrop;
};

class ManifestLoader {
public:
    static Result<Manifest> load(const std::filesystem::path& path);

    // baseDir anchors relative asset paths
    static Result<Manifest> parse(std::string_view text,
                                  const std::filesystem::path& baseDir);
};

} // namespace rs

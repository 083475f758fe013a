#include "ConfigParsers.hpp"
#include <algorithm>
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace rs {

namespace {
template <typename T>
T get(const toml::table& tbl, std::string_view key, T defaultVal) {
    if (auto node = tbl[key]) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto val = node.value<std::string>()) {
                return *val;
            }
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto val = node.value<bool>()) {
                return *val;
            }
        } else if constexpr (std::is_floating_point_v<T>) {
            if (auto val = node.value<double>()) {
                return static_cast<T>(*val);
            }
        } else if constexpr (std::is_integral_v<T>) {
            if (auto val = node.value<i64>()) {
                return static_cast<T>(std::max<i64>(*val, 0));
            }
        }
    }
    return defaultVal;
}

u32 even(u32 v) {
    return (v + 1) & ~1u;
}
} // namespace

void ConfigParsers::parseExport(const toml::table& tbl, ExportConfig& cfg) {
    auto exp = tbl["export"].as_table();
    if (!exp) {
        return;
    }

    // Encoders want even dimensions for 4:2:0 chroma
    cfg.width = even(std::clamp(get(*exp, "width", cfg.width), 160u, 7680u));
    cfg.height =
            even(std::clamp(get(*exp, "height", cfg.height), 160u, 4320u));
    cfg.fps = std::clamp(get(*exp, "fps", cfg.fps), 1u, 120u);
    cfg.background = Color::fromHex(
            get(*exp, "background", cfg.background.toHex()));
    cfg.completionTolerance = std::clamp(
            get(*exp, "completion_tolerance", cfg.completionTolerance),
            0.0,
            1.0);
    cfg.realtime = get(*exp, "realtime", cfg.realtime);
    cfg.videoAudioReplacesSpeech = get(
            *exp, "video_audio_replaces_speech", cfg.videoAudioReplacesSpeech);
    cfg.durationDivergenceWarning =
            std::max(0.0,
                     get(*exp,
                         "duration_divergence_warning",
                         cfg.durationDivergenceWarning));

    auto outDir = get(*exp, "output_directory", std::string());
    if (!outDir.empty()) {
        cfg.outputDirectory = file::expandHome(outDir);
    }
    cfg.filename = get(*exp, "filename", cfg.filename);
}

void ConfigParsers::parseCapture(const toml::table& tbl, CaptureConfig& cfg) {
    auto cap = tbl["capture"].as_table();
    if (!cap) {
        return;
    }

    cfg.videoBitrate =
            std::clamp(get(*cap, "video_bitrate", cfg.videoBitrate), 250u,
                       100000u);
    cfg.preset = get(*cap, "preset", cfg.preset);
    cfg.audioBitrate =
            std::clamp(get(*cap, "audio_bitrate", cfg.audioBitrate), 32u, 640u);
    cfg.sampleRate =
            std::clamp(get(*cap, "sample_rate", cfg.sampleRate), 8000u, 192000u);
    cfg.channels = std::clamp(get(*cap, "channels", cfg.channels), 1u, 2u);

    if (auto arr = (*cap)["candidates"].as_array()) {
        std::vector<CodecCandidate> candidates;
        for (const auto& node : *arr) {
            auto entry = node.as_table();
            if (!entry) {
                continue;
            }
            CodecCandidate c;
            c.mime = get(*entry, "mime", std::string());
            c.container = get(*entry, "container", std::string());
            c.videoCodec = get(*entry, "video_codec", std::string());
            c.audioCodec = get(*entry, "audio_codec", std::string());
            c.extension = get(*entry, "extension", c.container);
            if (c.container.empty() || c.videoCodec.empty() ||
                c.audioCodec.empty()) {
                LOG_WARN("Skipping incomplete codec candidate '{}'", c.mime);
                continue;
            }
            if (c.mime.empty()) {
                c.mime = "video/" + c.extension;
            }
            candidates.push_back(std::move(c));
        }
        cfg.candidates = std::move(candidates);
    }
}

void ConfigParsers::parseNormalization(const toml::table& tbl,
                                       NormalizationConfig& cfg) {
    auto norm = tbl["normalization"].as_table();
    if (!norm) {
        return;
    }

    cfg.enabled = get(*norm, "enabled", cfg.enabled);
    cfg.apiUrl = get(*norm, "api_url", cfg.apiUrl);
    cfg.modelName = get(*norm, "model_name", cfg.modelName);
    cfg.f0Method = get(*norm, "f0_method", cfg.f0Method);
    cfg.indexRate = std::clamp(get(*norm, "index_rate", cfg.indexRate), 0.0, 1.0);
    cfg.timeoutMs =
            std::clamp(get(*norm, "timeout_ms", cfg.timeoutMs), 1000u, 900000u);
}

toml::table ConfigParsers::serialize(const ExportConfig& exporting,
                                     const CaptureConfig& capture,
                                     const NormalizationConfig& normalization,
                                     bool debug) {
    toml::array candidates;
    for (const auto& c : capture.candidates) {
        candidates.push_back(toml::table{
                {"mime", c.mime},
                {"container", c.container},
                {"video_codec", c.videoCodec},
                {"audio_codec", c.audioCodec},
                {"extension", c.extension},
        });
    }

    return toml::table{
            {"general", toml::table{{"debug", debug}}},
            {"export",
             toml::table{
                     {"width", static_cast<i64>(exporting.width)},
                     {"height", static_cast<i64>(exporting.height)},
                     {"fps", static_cast<i64>(exporting.fps)},
                     {"background", exporting.background.toHex()},
                     {"completion_tolerance", exporting.completionTolerance},
                     {"realtime", exporting.realtime},
                     {"video_audio_replaces_speech",
                      exporting.videoAudioReplacesSpeech},
                     {"duration_divergence_warning",
                      exporting.durationDivergenceWarning},
                     {"output_directory", exporting.outputDirectory.string()},
                     {"filename", exporting.filename},
             }},
            {"capture",
             toml::table{
                     {"video_bitrate", static_cast<i64>(capture.videoBitrate)},
                     {"preset", capture.preset},
                     {"audio_bitrate", static_cast<i64>(capture.audioBitrate)},
                     {"sample_rate", static_cast<i64>(capture.sampleRate)},
                     {"channels", static_cast<i64>(capture.channels)},
                     {"candidates", candidates},
             }},
            {"normalization",
             toml::table{
                     {"enabled", normalization.enabled},
                     {"api_url", normalization.apiUrl},
                     {"model_name", normalization.modelName},
                     {"f0_method", normalization.f0Method},
                     {"index_rate", normalization.indexRate},
                     {"timeout_ms", static_cast<i64>(normalization.timeoutMs)},
             }},
    };
}

} // namespace rs

#include "AudioExtractor.hpp"
#include <cmath>
#include "AudioGraph.hpp"
#include "PcmEncoder.hpp"
#include "core/Logger.hpp"
#include "media/AudioDecoder.hpp"
#include "render/FrameClock.hpp"

namespace rs {

Result<std::vector<u8>> FastDecodeStrategy::extract(const MediaAssetHandle& video) {
    auto bytes = fetcher_.fetch(video.source());
    if (!bytes) {
        return Result<std::vector<u8>>::err(bytes.error());
    }

    auto pcm = AudioDecoder::decode(MediaSource::fromBytes(
            std::move(*bytes), video.source().mimeType(), MediaKind::Video));
    if (!pcm) {
        return Result<std::vector<u8>>::err(pcm.error());
    }
    if (pcm->frames() == 0) {
        return Result<std::vector<u8>>::err(ErrorCode::AssetLoad,
                                            "Audio track decoded to no samples");
    }
    return PcmEncoder::encode(*pcm);
}

Result<std::vector<u8>> RealtimeCaptureStrategy::extract(const MediaAssetHandle& video) {
    auto clone = video.clone();
    if (auto r = clone->load(); !r) {
        return Result<std::vector<u8>>::err(r.error());
    }

    MediaElement& el = clone->element();
    if (!el.hasAudio()) {
        return Result<std::vector<u8>>::err(ErrorCode::AssetLoad, "No audio track");
    }

    const AudioFormat format = el.audioFormat();
    AudioGraph graph(format, fps_);
    auto node = graph.createSource(*clone);
    if (!node) {
        return Result<std::vector<u8>>::err(node.error());
    }
    if (auto r = (*node)->connect(); !r) {
        return Result<std::vector<u8>>::err(r.error());
    }

    if (auto r = el.rewind(); !r) {
        return Result<std::vector<u8>>::err(r.error());
    }
    el.setMuted(false);

    const f64 duration = clone->duration().value_or(0.0);
    const f64 dt = 1.0 / fps_;
    // Stop even if the element never reports its end
    const u64 maxFrames = static_cast<u64>(std::ceil(duration * fps_)) + 2 * fps_;
    const u64 wantFrames = static_cast<u64>(std::llround(duration * format.sampleRate));

    auto clock = makeFrameClock(realtime_);
    clock->start(fps_);
    el.play();

    std::vector<f32> captured;
    captured.reserve(static_cast<usize>(wantFrames) * format.channels);
    for (u64 frame = 0; frame < maxFrames && !el.ended(); ++frame) {
        clock->waitNextFrame();
        if (auto r = el.advance(dt); !r) {
            el.pause();
            return Result<std::vector<u8>>::err(r.error());
        }
        auto mixed = graph.renderPeriod();
        captured.insert(captured.end(), mixed.begin(), mixed.end());
    }
    el.pause();
    (*node)->disconnect();

    // The last period may run past the end of the media
    const usize keep = static_cast<usize>(wantFrames) * format.channels;
    if (captured.size() > keep) {
        captured.resize(keep);
    }

    LOG_DEBUG("Captured {:.2f}s of audio from {}",
              static_cast<f64>(captured.size() / format.channels) / format.sampleRate,
              video.describe());
    return PcmEncoder::encode(PcmEncoder::floatToPcm16(captured),
                              format.channels,
                              format.sampleRate);
}

AudioExtractor::AudioExtractor(std::vector<std::unique_ptr<ExtractionStrategy>> strategies)
    : strategies_(std::move(strategies)) {
}

AudioExtractor AudioExtractor::withDefaults(MediaFetcher fetcher, u32 fps, bool realtime) {
    std::vector<std::unique_ptr<ExtractionStrategy>> list;
    list.push_back(std::make_unique<FastDecodeStrategy>(fetcher));
    list.push_back(std::make_unique<RealtimeCaptureStrategy>(fps, realtime));
    return AudioExtractor(std::move(list));
}

Result<std::vector<u8>> AudioExtractor::extract(const MediaAssetHandle& video) {
    std::string failures;
    for (auto& strategy : strategies_) {
        auto wav = strategy->extract(video);
        if (wav) {
            LOG_INFO("Extracted audio track via {}: {}", strategy->name(), video.describe());
            return wav;
        }
        LOG_WARN("Audio extraction via {} failed for {}: {}",
                 strategy->name(),
                 video.describe(),
                 wav.error().message);
        if (!failures.empty()) {
            failures += "; ";
        }
        failures += std::string(strategy->name()) + ": " + wav.error().message;
    }

    Error e(ErrorCode::AssetLoad,
            failures.empty() ? "No extraction strategy configured"
                             : "Could not extract audio track (" + failures + ")");
    e.forAsset(video.describe());
    return Result<std::vector<u8>>::err(std::move(e));
}

} // namespace rs

/**
 * @file AudioExtractor.hpp
 * @brief Recovers a video clip's audio track as WAV bytes.
 *
 * Extraction walks an ordered list of strategies and returns the first
 * success. The default list is:
 *
 *  1. FastDecodeStrategy: fetch the clip's bytes and decode the audio
 *     stream directly.
 *  2. RealtimeCaptureStrategy: play a clone of the clip through an isolated
 *     audio graph and record what comes out. Slow, but works whenever the
 *     element itself can play the clip.
 *
 * Neither strategy wires the handle it is given. The capture path routes a
 * clone, so the original stays free for the export graph.
 */

#pragma once
#include <memory>
#include <vector>
#include "media/MediaAssetHandle.hpp"
#include "media/MediaFetcher.hpp"
#include "util/Result.hpp"

namespace rs {

class ExtractionStrategy {
public:
    virtual ~ExtractionStrategy() = default;

    virtual const char* name() const = 0;
    virtual Result<std::vector<u8>> extract(const MediaAssetHandle& video) = 0;
};

class FastDecodeStrategy : public ExtractionStrategy {
public:
    explicit FastDecodeStrategy(MediaFetcher fetcher = MediaFetcher())
        : fetcher_(fetcher) {
    }

    const char* name() const override {
        return "fast-decode";
    }
    Result<std::vector<u8>> extract(const MediaAssetHandle& video) override;

private:
    MediaFetcher fetcher_;
};

class RealtimeCaptureStrategy : public ExtractionStrategy {
public:
    RealtimeCaptureStrategy(u32 fps, bool realtime) : fps_(fps), realtime_(realtime) {
    }

    const char* name() const override {
        return "realtime-capture";
    }
    Result<std::vector<u8>> extract(const MediaAssetHandle& video) override;

private:
    u32 fps_;
    bool realtime_;
};

class AudioExtractor {
public:
    explicit AudioExtractor(std::vector<std::unique_ptr<ExtractionStrategy>> strategies);

    // Fast decode first, then real-time capture paced at fps
    static AudioExtractor withDefaults(MediaFetcher fetcher, u32 fps, bool realtime);

    // Errors from every strategy are folded into the returned AssetLoad error
    Result<std::vector<u8>> extract(const MediaAssetHandle& video);

    usize strategyCount() const {
        return strategies_.size();
    }

private:
    std::vector<std::unique_ptr<ExtractionStrategy>> strategies_;
};

} // namespace rs

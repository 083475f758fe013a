/**
 * @file AudioGraph.hpp
 * @brief Mixing graph that collects the audible output of media elements.
 *
 * Each AudioSourceNode binds one MediaAssetHandle's element to the graph.
 * Creating a node consumes the handle's single "wired" slot; a second
 * createSource() on the same handle fails with ErrorCode::Programming.
 * Nodes can be connected and disconnected between segments, but never
 * rebound to another element.
 *
 * The graph renders in frame periods: period k of an N fps timeline covers
 * floor((k+1)*rate/N) - floor(k*rate/N) sample frames, so the audio stays
 * sample-exact against the video frame count over any length.
 */

#pragma once
#include <memory>
#include <vector>
#include "media/MediaAssetHandle.hpp"
#include "util/Result.hpp"

namespace rs {

class AudioGraph;

class AudioSourceNode {
public:
    AudioSourceNode(const AudioSourceNode&) = delete;
    AudioSourceNode& operator=(const AudioSourceNode&) = delete;

    MediaAssetHandle& handle() {
        return handle_;
    }
    bool isConnected() const {
        return connected_;
    }

    Result<void> connect();
    void disconnect();

private:
    friend class AudioGraph;
    explicit AudioSourceNode(MediaAssetHandle& handle) : handle_(handle) {
    }

    MediaAssetHandle& handle_;
    bool connected_{false};
};

class AudioGraph {
public:
    AudioGraph(AudioFormat format, u32 fps);
    ~AudioGraph();

    AudioGraph(const AudioGraph&) = delete;
    AudioGraph& operator=(const AudioGraph&) = delete;

    // Binds the handle's element to this graph. The node starts disconnected.
    Result<AudioSourceNode*> createSource(MediaAssetHandle& handle);

    // Sample frames in the next frame period
    usize nextPeriodFrames() const;

    // Mixes the next frame period from every connected node. Missing samples
    // are zero-filled.
    std::vector<f32> renderPeriod();

    // Mixes an explicit number of frames without advancing the period count
    std::vector<f32> render(usize frames);

    AudioFormat format() const {
        return format_;
    }
    u32 fps() const {
        return fps_;
    }
    u64 periodsRendered() const {
        return period_;
    }
    usize nodeCount() const {
        return nodes_.size();
    }
    usize connectedCount() const;

private:
    AudioFormat format_;
    u32 fps_;
    u64 period_{0};
    std::vector<std::unique_ptr<AudioSourceNode>> nodes_;
    std::vector<f32> scratch_;
};

} // namespace rs

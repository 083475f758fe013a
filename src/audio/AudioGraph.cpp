#include "AudioGraph.hpp"
#include <algorithm>
#include "core/Logger.hpp"

namespace rs {

Result<void> AudioSourceNode::connect() {
    if (connected_) {
        Error e(ErrorCode::Programming, "Audio node is already connected");
        e.forAsset(handle_.describe());
        return Result<void>::err(std::move(e));
    }
    handle_.element().setAudioRouted(true);
    connected_ = true;
    return Result<void>::ok();
}

void AudioSourceNode::disconnect() {
    if (!connected_) {
        return;
    }
    handle_.element().setAudioRouted(false);
    connected_ = false;
}

AudioGraph::AudioGraph(AudioFormat format, u32 fps)
    : format_(format), fps_(std::max(1u, fps)) {
}

AudioGraph::~AudioGraph() {
    for (auto& node : nodes_) {
        node->disconnect();
    }
}

Result<AudioSourceNode*> AudioGraph::createSource(MediaAssetHandle& handle) {
    if (handle.element().audioFormat() != format_) {
        Error e(ErrorCode::Programming,
                "Element audio format does not match the graph");
        e.forAsset(handle.describe());
        return Result<AudioSourceNode*>::err(std::move(e));
    }
    if (auto wired = handle.markWired(); !wired) {
        return Result<AudioSourceNode*>::err(wired.error());
    }

    nodes_.push_back(std::unique_ptr<AudioSourceNode>(new AudioSourceNode(handle)));
    LOG_TRACE("Audio node created for {}", handle.describe());
    return Result<AudioSourceNode*>::ok(nodes_.back().get());
}

usize AudioGraph::nextPeriodFrames() const {
    const u64 rate = format_.sampleRate;
    return static_cast<usize>((period_ + 1) * rate / fps_ - period_ * rate / fps_);
}

std::vector<f32> AudioGraph::renderPeriod() {
    auto out = render(nextPeriodFrames());
    ++period_;
    return out;
}

std::vector<f32> AudioGraph::render(usize frames) {
    const usize channels = format_.channels;
    std::vector<f32> out(frames * channels, 0.0f);

    for (auto& node : nodes_) {
        if (!node->connected_) {
            continue;
        }
        scratch_.clear();
        const usize got = node->handle_.element().drainAudio(scratch_, frames);
        const usize n = std::min(got * channels, out.size());
        for (usize i = 0; i < n; ++i) {
            out[i] += scratch_[i];
        }
    }

    for (auto& s : out) {
        s = std::clamp(s, -1.0f, 1.0f);
    }
    return out;
}

usize AudioGraph::connectedCount() const {
    return static_cast<usize>(std::count_if(
            nodes_.begin(), nodes_.end(), [](const auto& n) { return n->isConnected(); }));
}

} // namespace rs

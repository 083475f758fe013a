#pragma once
// FakeMedia.hpp - Scripted media elements for engine-level tests
// Elements advance a virtual clock and produce constant-valued audio and
// single-colour pictures, so tests can assert on exact frame counts and
// on which source was audible.

#include <QColor>
#include <QImage>
#include <atomic>
#include <cmath>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "audio/PcmEncoder.hpp"
#include "media/MediaElementFactory.hpp"

namespace rs::test {

struct FakeClip {
    f64 duration{1.0};
    bool hasAudio{true};
    bool hasVideo{false};
    f32 audioValue{0.25f};
    QColor color{Qt::red};
    bool emitsEnded{true};       // false: only the position poll can complete it
    std::string loadError;       // non-empty: load() fails with this message
};

// Shared with the test after the element itself is gone
struct FakeMediaStats {
    std::atomic<int> created{0};
    std::atomic<int> loads{0};
    std::atomic<int> routedCount{0}; // setAudioRouted(true) calls
    std::atomic<int> advanced{0};    // advance() calls while playing
};

class FakeMediaElement : public MediaElement {
public:
    FakeMediaElement(FakeClip clip, AudioFormat format, std::shared_ptr<FakeMediaStats> stats)
        : clip_(std::move(clip)), format_(format), stats_(std::move(stats)) {
        ++stats_->created;
    }

    Result<void> load() override {
        ++stats_->loads;
        if (!clip_.loadError.empty()) {
            return Result<void>::err(ErrorCode::AssetLoad, clip_.loadError);
        }
        if (clip_.hasVideo) {
            picture_ = QImage(36, 64, QImage::Format_RGBA8888);
            picture_.fill(clip_.color);
        }
        loaded_ = true;
        return Result<void>::ok();
    }
    bool isLoaded() const override {
        return loaded_;
    }
    std::optional<f64> duration() const override {
        if (!loaded_) {
            return std::nullopt;
        }
        return clip_.duration;
    }

    bool hasAudio() const override {
        return clip_.hasAudio;
    }
    bool hasVideo() const override {
        return clip_.hasVideo;
    }

    void play() override {
        if (ended_) {
            (void)rewind();
        }
        playing_ = true;
    }
    void pause() override {
        playing_ = false;
    }
    Result<void> rewind() override {
        position_ = 0.0;
        emitted_ = 0;
        ended_ = false;
        pending_.clear();
        return Result<void>::ok();
    }

    bool isPlaying() const override {
        return playing_;
    }
    bool ended() const override {
        return ended_;
    }
    f64 currentTime() const override {
        return position_;
    }

    void setMuted(bool muted) override {
        muted_ = muted;
    }
    bool muted() const override {
        return muted_;
    }

    Result<void> advance(f64 dt) override {
        if (!playing_ || ended_) {
            return Result<void>::ok();
        }
        ++stats_->advanced;
        position_ = std::min(position_ + dt, clip_.duration);

        const u64 target = static_cast<u64>(std::llround(position_ * format_.sampleRate));
        if (clip_.hasAudio && routed_) {
            const f32 v = muted_ ? 0.0f : clip_.audioValue;
            pending_.insert(pending_.end(), (target - emitted_) * format_.channels, v);
        }
        emitted_ = target;

        if (position_ >= clip_.duration) {
            ended_ = true;
            playing_ = false;
            if (clip_.emitsEnded) {
                endReached.emitSignal();
            }
        }
        return Result<void>::ok();
    }

    const QImage& currentFrame() const override {
        return picture_;
    }

    void setAudioRouted(bool routed) override {
        if (routed) {
            ++stats_->routedCount;
        }
        routed_ = routed;
        if (!routed) {
            pending_.clear();
        }
    }
    usize drainAudio(std::vector<f32>& out, usize maxFrames) override {
        const usize frames = std::min(maxFrames, pending_.size() / format_.channels);
        const usize n = frames * format_.channels;
        out.insert(out.end(), pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(n));
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(n));
        return frames;
    }

    AudioFormat audioFormat() const override {
        return format_;
    }

private:
    FakeClip clip_;
    AudioFormat format_;
    std::shared_ptr<FakeMediaStats> stats_;
    QImage picture_;
    std::vector<f32> pending_;
    u64 emitted_{0};
    f64 position_{0.0};
    bool loaded_{false};
    bool playing_{false};
    bool ended_{false};
    bool muted_{false};
    bool routed_{false};
};

// URI sources are looked up by uri; in-memory WAV sources get an audio-only
// clip whose duration is read from the WAV header.
class FakeMediaFactory : public MediaElementFactory {
public:
    void add(const std::string& uri, FakeClip clip) {
        std::lock_guard lock(mutex_);
        clips_[uri] = std::move(clip);
    }

    // Audio value used for in-memory (converted) clips
    void setMemoryAudioValue(f32 v) {
        memoryAudioValue_ = v;
    }

    std::shared_ptr<FakeMediaStats> stats(const std::string& key) {
        std::lock_guard lock(mutex_);
        auto& s = stats_[key];
        if (!s) {
            s = std::make_shared<FakeMediaStats>();
        }
        return s;
    }

    int totalCreated() {
        std::lock_guard lock(mutex_);
        int n = 0;
        for (auto& [key, s] : stats_) {
            n += s->created;
        }
        return n;
    }

    std::unique_ptr<MediaElement> create(const MediaSource& source, AudioFormat format) override {
        FakeClip clip;
        std::string key = source.uri();
        if (source.inMemory()) {
            key = "memory";
            auto pcm = PcmEncoder::decode(*source.bytes());
            if (pcm) {
                clip.duration = pcm->seconds();
                clip.audioValue = memoryAudioValue_;
            } else {
                clip.loadError = pcm.error().message;
            }
        } else {
            std::lock_guard lock(mutex_);
            auto it = clips_.find(key);
            if (it != clips_.end()) {
                clip = it->second;
            } else {
                clip.loadError = "No such fake media: " + key;
            }
        }
        return std::make_unique<FakeMediaElement>(clip, format, stats(key));
    }

private:
    std::mutex mutex_;
    std::map<std::string, FakeClip> clips_;
    std::map<std::string, std::shared_ptr<FakeMediaStats>> stats_;
    f32 memoryAudioValue_{0.75f};
};

// Silent 16-bit WAV of the given length, as the voice service would return it
inline std::vector<u8> silentWav(f64 seconds, u32 sampleRate = 8000) {
    std::vector<i16> samples(static_cast<usize>(std::llround(seconds * sampleRate)), 0);
    return *PcmEncoder::encode(samples, 1, sampleRate);
}

} // namespace rs::test

#pragma once
// FrameClock.hpp - Frame pacing for the composite and capture loops
// The clock only decides when the next frame may be produced; media
// positions advance by exactly one frame period per frame regardless.

#include <memory>
#include "util/Types.hpp"

namespace rs {

class FrameClock {
public:
    virtual ~FrameClock() = default;

    virtual void start(u32 fps) = 0;
    // Blocks until the next frame is due
    virtual void waitNextFrame() = 0;

    u64 frameCount() const {
        return frames_;
    }

protected:
    u64 frames_{0};
};

// Sleeps until each frame deadline; used for live capture
class RealTimeFrameClock : public FrameClock {
public:
    void start(u32 fps) override;
    void waitNextFrame() override;

private:
    TimePoint origin_;
    std::chrono::nanoseconds period_{0};
};

// Never waits; frames are produced as fast as the loop runs
class ImmediateFrameClock : public FrameClock {
public:
    void start(u32) override {
        frames_ = 0;
    }
    void waitNextFrame() override {
        ++frames_;
    }
};

std::unique_ptr<FrameClock> makeFrameClock(bool realtime);

} // namespace rs

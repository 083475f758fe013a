#include "FrameClock.hpp"
#include <algorithm>
#include <thread>

namespace rs {

void RealTimeFrameClock::start(u32 fps) {
    period_ = std::chrono::nanoseconds(1'000'000'000LL / std::max(1u, fps));
    origin_ = Clock::now();
    frames_ = 0;
}

void RealTimeFrameClock::waitNextFrame() {
    // Deadlines are computed from the origin so sleep overshoot never drifts
    const auto deadline = origin_ + period_ * static_cast<i64>(frames_);
    std::this_thread::sleep_until(deadline);
    ++frames_;
}

std::unique_ptr<FrameClock> makeFrameClock(bool realtime) {
    if (realtime) {
        return std::make_unique<RealTimeFrameClock>();
    }
    return std::make_unique<ImmediateFrameClock>();
}

} // namespace rs

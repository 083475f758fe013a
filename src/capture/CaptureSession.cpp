#include "CaptureSession.hpp"
#include "core/Logger.hpp"

namespace rs {

CaptureSession::CaptureSession(std::unique_ptr<CaptureSink> sink)
    : sink_(std::move(sink)) {
}

CaptureSession::~CaptureSession() {
    abort();
}

Result<void> CaptureSession::start(const EncoderSettings& settings) {
    if (active_) {
        return Result<void>::err(ErrorCode::Programming, "Capture already started");
    }

    settings_ = settings;
    frames_ = 0;
    samples_ = 0;
    if (auto r = sink_->open(settings_); !r) {
        Error e = r.error();
        if (e.code != ErrorCode::InvalidInput) {
            e.code = ErrorCode::Capture;
        }
        sink_->discard();
        return Result<void>::err(std::move(e));
    }
    active_ = true;
    LOG_DEBUG("Capture session started ({}x{} @ {} fps, {})",
              settings_.width,
              settings_.height,
              settings_.fps,
              settings_.candidate.mime);
    return Result<void>::ok();
}

Result<void> CaptureSession::pushFrame(const QImage& frame, std::span<const f32> audio) {
    if (!active_) {
        return Result<void>::err(ErrorCode::Capture, "Capture session is not active");
    }

    if (auto r = sink_->writeVideoFrame(frame); !r) {
        return fail(r.error());
    }
    if (auto r = sink_->writeAudio(audio); !r) {
        return fail(r.error());
    }

    ++frames_;
    samples_ += audio.size();
    return Result<void>::ok();
}

Result<std::vector<u8>> CaptureSession::finish() {
    if (!active_) {
        return Result<std::vector<u8>>::err(ErrorCode::Capture,
                                            "Capture session is not active");
    }
    active_ = false;

    auto bytes = sink_->finish();
    if (!bytes) {
        Error e = bytes.error();
        e.code = ErrorCode::Capture;
        sink_->discard();
        return Result<std::vector<u8>>::err(std::move(e));
    }
    if (bytes->empty()) {
        sink_->discard();
        return Result<std::vector<u8>>::err(ErrorCode::Capture, "Capture produced no data");
    }
    LOG_DEBUG("Capture session finished: {} frames", frames_);
    return bytes;
}

void CaptureSession::abort() {
    if (!sink_) {
        return;
    }
    if (active_) {
        LOG_DEBUG("Capture session aborted after {} frames", frames_);
    }
    active_ = false;
    sink_->discard();
}

Result<void> CaptureSession::fail(Error error) {
    error.code = ErrorCode::Capture;
    abort();
    return Result<void>::err(std::move(error));
}

} // namespace rs

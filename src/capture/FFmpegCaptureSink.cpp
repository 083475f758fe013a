#include "FFmpegCaptureSink.hpp"
#include <algorithm>
#include <system_error>
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace rs {

FFmpegCaptureSink::FFmpegCaptureSink(usize maxQueuedItems)
    : maxQueued_(std::max<usize>(1, maxQueuedItems)) {
}

FFmpegCaptureSink::~FFmpegCaptureSink() {
    discard();
}

Result<void> FFmpegCaptureSink::open(const EncoderSettings& settings) {
    if (open_) {
        return Result<void>::err(ErrorCode::Programming, "Capture sink already open");
    }
    if (auto valid = settings.validate(); !valid) {
        return valid;
    }

    settings_ = settings;
    if (settings_.outputPath.empty()) {
        settings_.outputPath = file::tempPath("capture", settings_.candidate.extension);
    }
    file::ensureDir(settings_.outputPath.parent_path());

    if (auto r = encoder_.init(settings_); !r) {
        encoder_.cleanup();
        removeTempFile();
        return r;
    }

    {
        std::lock_guard lock(mutex_);
        queue_.clear();
        draining_ = false;
        error_.reset();
    }
    audioBuffer_.clear();
    open_ = true;
    thread_ = std::jthread([this](std::stop_token st) { threadLoop(st); });

    LOG_DEBUG("Capture started: {}", settings_.outputPath.string());
    return Result<void>::ok();
}

Result<void> FFmpegCaptureSink::writeVideoFrame(const QImage& frame) {
    Item item;
    item.frame = frame.copy();
    return enqueue(std::move(item));
}

Result<void> FFmpegCaptureSink::writeAudio(std::span<const f32> samples) {
    if (samples.empty()) {
        return Result<void>::ok();
    }
    Item item;
    item.audio.assign(samples.begin(), samples.end());
    return enqueue(std::move(item));
}

Result<void> FFmpegCaptureSink::enqueue(Item item) {
    if (!open_) {
        return Result<void>::err(ErrorCode::Capture, "Capture sink is not open");
    }

    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return queue_.size() < maxQueued_ || error_.has_value(); });
    if (error_) {
        return Result<void>::err(*error_);
    }
    queue_.push_back(std::move(item));
    cv_.notify_all();
    return Result<void>::ok();
}

void FFmpegCaptureSink::threadLoop(std::stop_token stopToken) {
    LOG_DEBUG("Encoding thread started");
    while (true) {
        Item item;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, stopToken, [this] { return !queue_.empty() || draining_; });
            if (queue_.empty()) {
                // Either draining with nothing left, or a stop was requested
                break;
            }
            item = std::move(queue_.front());
            queue_.pop_front();
            cv_.notify_all();
        }

        Result<void> r = Result<void>::ok();
        if (!item.frame.isNull()) {
            r = encoder_.encodeVideo(item.frame);
        }
        if (r && !item.audio.empty()) {
            audioBuffer_.insert(audioBuffer_.end(), item.audio.begin(), item.audio.end());
            r = encoder_.encodeAudio(audioBuffer_);
        }

        if (!r) {
            LOG_ERROR("Encoding failed: {}", r.error().message);
            std::lock_guard lock(mutex_);
            error_ = r.error();
            queue_.clear();
            cv_.notify_all();
            break;
        }
    }
    LOG_DEBUG("Encoding thread finishing");
}

void FFmpegCaptureSink::stopWorker() {
    {
        std::lock_guard lock(mutex_);
        draining_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

Result<std::vector<u8>> FFmpegCaptureSink::finish() {
    if (!open_) {
        return Result<std::vector<u8>>::err(ErrorCode::Capture, "Capture sink is not open");
    }

    stopWorker();
    open_ = false;

    std::optional<Error> failure;
    {
        std::lock_guard lock(mutex_);
        failure = error_;
    }
    if (!failure) {
        if (auto r = encoder_.finish(audioBuffer_); !r) {
            failure = r.error();
        }
    }
    encoder_.cleanup();

    if (failure) {
        removeTempFile();
        return Result<std::vector<u8>>::err(*failure);
    }

    auto bytes = file::readBytes(settings_.outputPath);
    removeTempFile();
    if (!bytes) {
        return Result<std::vector<u8>>::err(ErrorCode::Capture,
                                            "Could not read capture: " + bytes.error().message);
    }

    LOG_DEBUG("Capture finished: {} bytes", bytes->size());
    return bytes;
}

void FFmpegCaptureSink::discard() {
    if (thread_.joinable()) {
        thread_.request_stop();
        cv_.notify_all();
        thread_.join();
    }
    if (open_) {
        LOG_DEBUG("Capture discarded");
        open_ = false;
        encoder_.cleanup();
        removeTempFile();
    }
    std::lock_guard lock(mutex_);
    queue_.clear();
}

void FFmpegCaptureSink::removeTempFile() {
    if (settings_.outputPath.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(settings_.outputPath, ec);
    if (ec) {
        LOG_WARN("Could not remove {}: {}", settings_.outputPath.string(), ec.message());
    }
}

} // namespace rs

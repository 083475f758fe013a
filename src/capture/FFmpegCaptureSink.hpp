/**
 * @file FFmpegCaptureSink.hpp
 * @brief Threaded CaptureSink muxing to a temporary file.
 *
 * The export loop hands each composited frame and its audio period to
 * writeVideoFrame()/writeAudio(); both only enqueue. A worker thread owns
 * the CaptureEncoder and drains the queue in submission order. The queue is
 * bounded, so a loop running faster than the encoder is throttled rather
 * than buffering the whole recording in memory.
 *
 * The first encoder error is latched and returned from the next write or
 * from finish(); finish() then deletes the temporary file.
 *
 * @section Patterns
 * - Producer-Consumer: export thread produces, encoder thread consumes.
 * - RAII: the worker is a std::jthread joined on destruction.
 */

#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include "CaptureEncoder.hpp"
#include "CaptureSink.hpp"

namespace rs {

class FFmpegCaptureSink : public CaptureSink {
public:
    explicit FFmpegCaptureSink(usize maxQueuedItems = 64);
    ~FFmpegCaptureSink() override;

    Result<void> open(const EncoderSettings& settings) override;
    Result<void> writeVideoFrame(const QImage& frame) override;
    Result<void> writeAudio(std::span<const f32> samples) override;
    Result<std::vector<u8>> finish() override;
    void discard() override;

private:
    struct Item {
        QImage frame;
        std::vector<f32> audio;
    };

    Result<void> enqueue(Item item);
    void threadLoop(std::stop_token stopToken);
    void stopWorker();
    void removeTempFile();

    CaptureEncoder encoder_;
    EncoderSettings settings_;
    usize maxQueued_;

    std::jthread thread_;
    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Item> queue_;
    bool draining_{false};
    std::optional<Error> error_;

    // Audio not yet forming a whole encoder frame; worker-owned
    std::vector<f32> audioBuffer_;
    bool open_{false};
};

} // namespace rs

/**
 * @file MediaAssetHandle.hpp
 * @brief Per-export capability object owning one playable element.
 *
 * A handle wraps exactly one MediaElement created from a MediaSource. It
 * caches the element's duration once loaded and carries the "wired" flag:
 * an element's output can be bound to an audio graph at most once in its
 * lifetime, so AudioGraph::createSource() refuses a handle that is already
 * wired. Code that needs to route the same content a second time (the slow
 * audio extraction path) must clone() the handle, which creates a fresh,
 * never-wired element for the same source.
 *
 * Handles are created fresh for every export and are neither copyable nor
 * movable, so graph nodes and synchronizers may hold plain references.
 */

#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "MediaElement.hpp"
#include "MediaElementFactory.hpp"
#include "MediaSource.hpp"
#include "util/Result.hpp"

namespace rs {

class MediaAssetHandle {
public:
    MediaAssetHandle(MediaSource source,
                     std::shared_ptr<MediaElementFactory> factory,
                     AudioFormat format = {});

    MediaAssetHandle(const MediaAssetHandle&) = delete;
    MediaAssetHandle& operator=(const MediaAssetHandle&) = delete;

    const MediaSource& source() const {
        return source_;
    }
    MediaElement& element() {
        return *element_;
    }
    const MediaElement& element() const {
        return *element_;
    }

    // Loads the element once; later calls return the cached outcome.
    // Safe to call from a worker thread.
    Result<void> load();
    bool isLoaded() const;

    // Empty until load() has succeeded
    std::optional<f64> duration() const;

    bool isWired() const {
        return wired_;
    }
    // Fails with ErrorCode::Programming if already wired
    Result<void> markWired();

    // Fresh handle over the same source with its own never-wired element
    std::unique_ptr<MediaAssetHandle> clone() const;

    std::string describe() const {
        return source_.describe();
    }

private:
    MediaSource source_;
    std::shared_ptr<MediaElementFactory> factory_;
    AudioFormat format_;
    std::unique_ptr<MediaElement> element_;

    mutable std::mutex mutex_;
    std::optional<f64> duration_;
    std::optional<Error> loadError_;
    bool wired_{false};
};

} // namespace rs

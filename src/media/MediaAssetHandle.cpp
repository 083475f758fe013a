#include "MediaAssetHandle.hpp"
#include <algorithm>
#include "core/Logger.hpp"

namespace rs {

MediaAssetHandle::MediaAssetHandle(MediaSource source,
                                   std::shared_ptr<MediaElementFactory> factory,
                                   AudioFormat format)
    : source_(std::move(source)),
      factory_(std::move(factory)),
      format_(format),
      element_(factory_->create(source_, format_)) {
}

Result<void> MediaAssetHandle::load() {
    std::lock_guard lock(mutex_);
    if (duration_) {
        return Result<void>::ok();
    }
    if (loadError_) {
        return Result<void>::err(*loadError_);
    }

    auto result = element_->load();
    if (!result) {
        Error e = result.error();
        e.code = ErrorCode::AssetLoad;
        if (e.asset.empty()) {
            e.forAsset(describe());
        }
        loadError_ = e;
        return Result<void>::err(std::move(e));
    }

    auto dur = element_->duration();
    if (!dur) {
        Error e(ErrorCode::AssetLoad, "Metadata loaded without a duration");
        e.forAsset(describe());
        loadError_ = e;
        return Result<void>::err(std::move(e));
    }
    duration_ = std::max(0.0, *dur);
    return Result<void>::ok();
}

bool MediaAssetHandle::isLoaded() const {
    std::lock_guard lock(mutex_);
    return duration_.has_value();
}

std::optional<f64> MediaAssetHandle::duration() const {
    std::lock_guard lock(mutex_);
    return duration_;
}

Result<void> MediaAssetHandle::markWired() {
    if (wired_) {
        LOG_CRITICAL("Media element wired twice: {}", describe());
        Error e(ErrorCode::Programming,
                "Media element is already connected to an audio graph");
        e.forAsset(describe());
        return Result<void>::err(std::move(e));
    }
    wired_ = true;
    return Result<void>::ok();
}

std::unique_ptr<MediaAssetHandle> MediaAssetHandle::clone() const {
    return std::make_unique<MediaAssetHandle>(source_, factory_, format_);
}

} // namespace rs

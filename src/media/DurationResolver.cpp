#include "DurationResolver.hpp"
#include "core/Logger.hpp"

namespace rs {

namespace {

Result<f64> loadDuration(MediaAssetHandle& handle) {
    auto loaded = handle.load();
    if (!loaded) {
        return Result<f64>::err(loaded.error());
    }
    return Result<f64>::ok(*handle.duration());
}

} // namespace

std::future<Result<f64>> DurationResolver::resolve(MediaAssetHandle& handle) {
    if (auto cached = handle.duration()) {
        std::promise<Result<f64>> ready;
        ready.set_value(Result<f64>::ok(*cached));
        return ready.get_future();
    }
    return std::async(std::launch::async,
                      [&handle] { return loadDuration(handle); });
}

Result<std::vector<f64>> DurationResolver::resolveAll(
        const std::vector<MediaAssetHandle*>& handles) {
    std::vector<std::future<Result<f64>>> pending;
    pending.reserve(handles.size());
    for (auto* handle : handles) {
        pending.push_back(resolve(*handle));
    }

    // Wait for every probe before returning so no worker outlives its handle
    std::vector<Result<f64>> results;
    results.reserve(pending.size());
    for (auto& f : pending) {
        results.push_back(f.get());
    }

    std::vector<f64> durations;
    durations.reserve(results.size());
    for (usize i = 0; i < results.size(); ++i) {
        if (!results[i]) {
            LOG_ERROR("Failed to load {}: {}",
                      handles[i]->describe(),
                      results[i].error().message);
            return Result<std::vector<f64>>::err(results[i].error());
        }
        durations.push_back(*results[i]);
    }
    return Result<std::vector<f64>>::ok(std::move(durations));
}

} // namespace rs

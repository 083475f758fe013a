#pragma once
// DurationResolver.hpp - Asynchronous metadata loading for asset handles
// A handle's element is loaded once; later resolves return the cached value.

#include <future>
#include <vector>
#include "MediaAssetHandle.hpp"
#include "util/Result.hpp"

namespace rs {

class DurationResolver {
public:
    // The handle must outlive the returned future
    static std::future<Result<f64>> resolve(MediaAssetHandle& handle);

    // Resolves every handle concurrently and waits. On failure the error of
    // the first failing handle (in input order) is returned.
    static Result<std::vector<f64>> resolveAll(
            const std::vector<MediaAssetHandle*>& handles);
};

} // namespace rs

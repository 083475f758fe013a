#pragma once
// MediaFetcher.hpp - Retrieves the raw bytes behind a MediaSource
// Local paths are read directly; http(s) URIs go through Qt Network and need
// a running QCoreApplication on the calling thread.

#include <string>
#include <vector>
#include "MediaSource.hpp"
#include "util/Result.hpp"

namespace rs {

class MediaFetcher {
public:
    explicit MediaFetcher(u32 timeoutMs = 60000) : timeoutMs_(timeoutMs) {
    }

    Result<std::vector<u8>> fetch(const MediaSource& source) const;

private:
    Result<std::vector<u8>> httpGet(const std::string& url) const;

    u32 timeoutMs_;
};

} // namespace rs

#pragma once
// CodecNegotiator.hpp - Picks the output container/codec pair
// Candidates are tried in order; the first one the probe accepts wins.

#include <memory>
#include <vector>
#include "core/ConfigData.hpp"
#include "util/Result.hpp"

namespace rs {

class CodecProbe {
public:
    virtual ~CodecProbe() = default;
    virtual bool isSupported(const CodecCandidate& candidate) const = 0;
};

// Muxer exists, both encoders exist, and the muxer accepts both codecs
class FFmpegCodecProbe : public CodecProbe {
public:
    bool isSupported(const CodecCandidate& candidate) const override;
};

class CodecNegotiator {
public:
    explicit CodecNegotiator(std::shared_ptr<const CodecProbe> probe);

    // ErrorCode::CodecNegotiation when no candidate is supported
    Result<CodecCandidate> negotiate(const std::vector<CodecCandidate>& candidates) const;

private:
    std::shared_ptr<const CodecProbe> probe_;
};

} // namespace rs

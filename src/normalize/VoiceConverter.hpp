#pragma once
// VoiceConverter.hpp - Boundary to the external voice-timbre conversion service

#include <optional>
#include <string>
#include <vector>
#include "core/ConfigData.hpp"
#include "util/Result.hpp"

namespace rs {

struct NormalizationOptions {
    std::string apiUrl;    // service root, e.g. http://localhost:8001
    std::string modelName; // trained model name without extension
    std::optional<std::string> f0Method;
    std::optional<f64> indexRate; // 0..1
    u32 timeoutMs{120000};

    static NormalizationOptions fromConfig(const NormalizationConfig& cfg);
};

class VoiceConverter {
public:
    virtual ~VoiceConverter() = default;

    // Sends WAV bytes and returns the converted audio bytes.
    // Failures carry ErrorCode::Normalization.
    virtual Result<std::vector<u8>> convert(const std::vector<u8>& wav,
                                            const NormalizationOptions& options) = 0;
};

} // namespace rs

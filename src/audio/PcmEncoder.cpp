#include "PcmEncoder.hpp"
#include <algorithm>
#include <cstring>
#include <limits>

namespace rs {

namespace {

void put16(std::vector<u8>& out, u16 v) {
    out.push_back(static_cast<u8>(v & 0xFF));
    out.push_back(static_cast<u8>(v >> 8));
}

void put32(std::vector<u8>& out, u32 v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<u8>((v >> (8 * i)) & 0xFF));
    }
}

void putTag(std::vector<u8>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

u16 get16(const u8* p) {
    return static_cast<u16>(p[0] | (p[1] << 8));
}

u32 get32(const u8* p) {
    return static_cast<u32>(p[0]) | (static_cast<u32>(p[1]) << 8) |
           (static_cast<u32>(p[2]) << 16) | (static_cast<u32>(p[3]) << 24);
}

} // namespace

Result<std::vector<u8>> PcmEncoder::encode(std::span<const i16> samples,
                                           u32 channels,
                                           u32 sampleRate) {
    if (channels == 0 || channels > 0xFFFF) {
        return Result<std::vector<u8>>::err(ErrorCode::InvalidInput,
                                            "Invalid channel count");
    }
    if (sampleRate == 0) {
        return Result<std::vector<u8>>::err(ErrorCode::InvalidInput,
                                            "Invalid sample rate");
    }
    if (samples.size() % channels != 0) {
        return Result<std::vector<u8>>::err(
                ErrorCode::InvalidInput,
                "Sample count is not a multiple of the channel count");
    }

    const u64 dataSize = static_cast<u64>(samples.size()) * 2;
    if (dataSize > std::numeric_limits<u32>::max() - 36) {
        return Result<std::vector<u8>>::err(ErrorCode::InvalidInput,
                                            "PCM data too large for WAV");
    }

    const u16 blockAlign = static_cast<u16>(channels * 2);
    const u32 byteRate = sampleRate * blockAlign;

    std::vector<u8> out;
    out.reserve(kHeaderSize + static_cast<usize>(dataSize));

    putTag(out, "RIFF");
    put32(out, static_cast<u32>(36 + dataSize));
    putTag(out, "WAVE");

    putTag(out, "fmt ");
    put32(out, 16);
    put16(out, 1); // PCM
    put16(out, static_cast<u16>(channels));
    put32(out, sampleRate);
    put32(out, byteRate);
    put16(out, blockAlign);
    put16(out, 16);

    putTag(out, "data");
    put32(out, static_cast<u32>(dataSize));
    for (i16 s : samples) {
        put16(out, static_cast<u16>(s));
    }

    return Result<std::vector<u8>>::ok(std::move(out));
}

Result<MediaSource> PcmEncoder::toMediaSource(std::span<const i16> samples,
                                              u32 channels,
                                              u32 sampleRate) {
    auto wav = encode(samples, channels, sampleRate);
    if (!wav) {
        return Result<MediaSource>::err(wav.error());
    }
    return Result<MediaSource>::ok(
            MediaSource::fromBytes(std::move(*wav), "audio/wav", MediaKind::Audio));
}

Result<PcmBuffer> PcmEncoder::decode(std::span<const u8> wav) {
    auto fail = [](std::string msg) {
        return Result<PcmBuffer>::err(ErrorCode::InvalidInput, std::move(msg));
    };

    if (wav.size() < 12 || std::memcmp(wav.data(), "RIFF", 4) != 0 ||
        std::memcmp(wav.data() + 8, "WAVE", 4) != 0) {
        return fail("Not a RIFF/WAVE file");
    }

    PcmBuffer pcm;
    bool haveFormat = false;
    usize pos = 12;
    while (pos + 8 <= wav.size()) {
        const u8* chunk = wav.data() + pos;
        const u32 size = get32(chunk + 4);
        const usize body = pos + 8;
        if (body + size > wav.size()) {
            return fail("Truncated chunk");
        }

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (size < 16) {
                return fail("Short fmt chunk");
            }
            const u8* f = wav.data() + body;
            if (get16(f) != 1 || get16(f + 14) != 16) {
                return fail("Only 16-bit PCM is supported");
            }
            pcm.channels = get16(f + 2);
            pcm.sampleRate = get32(f + 4);
            if (pcm.channels == 0 || pcm.sampleRate == 0) {
                return fail("Invalid format");
            }
            haveFormat = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!haveFormat) {
                return fail("data chunk before fmt chunk");
            }
            const u8* d = wav.data() + body;
            pcm.samples.resize(size / 2);
            for (usize i = 0; i < pcm.samples.size(); ++i) {
                pcm.samples[i] = static_cast<i16>(get16(d + 2 * i));
            }
            return Result<PcmBuffer>::ok(std::move(pcm));
        }
        // Chunks are word aligned
        pos = body + size + (size & 1);
    }
    return fail("No data chunk");
}

i16 PcmEncoder::floatToPcm16(f32 sample) {
    const f32 s = std::clamp(sample, -1.0f, 1.0f);
    return static_cast<i16>(s < 0.0f ? s * 32768.0f : s * 32767.0f);
}

std::vector<i16> PcmEncoder::floatToPcm16(std::span<const f32> samples) {
    std::vector<i16> out(samples.size());
    std::transform(samples.begin(), samples.end(), out.begin(), [](f32 s) {
        return floatToPcm16(s);
    });
    return out;
}

} // namespace rs

#pragma once
// MediaSource.hpp - Reference to playable content: a URI or an in-memory blob

#include <memory>
#include <string>
#include <vector>
#include "util/Types.hpp"

namespace rs {

enum class MediaKind { Audio, Video, Image };

class MediaSource {
public:
    MediaSource() = default;

    // Filesystem path, file:// URL or http(s):// URL
    static MediaSource fromUri(std::string uri, MediaKind kind);

    // In-memory bytes, e.g. an encoded WAV or a converted clip
    static MediaSource fromBytes(std::vector<u8> bytes,
                                 std::string mimeType,
                                 MediaKind kind);

    MediaKind kind() const {
        return kind_;
    }
    bool inMemory() const {
        return bytes_ != nullptr;
    }
    bool isRemote() const;
    bool empty() const {
        return uri_.empty() && !bytes_;
    }

    const std::string& uri() const {
        return uri_;
    }
    // Local filesystem path for path and file:// URIs, empty otherwise
    std::string localPath() const;

    const std::string& mimeType() const {
        return mimeType_;
    }
    std::shared_ptr<const std::vector<u8>> bytes() const {
        return bytes_;
    }

    // Human-readable label for logs and error context
    std::string describe() const;

private:
    MediaKind kind_{MediaKind::Audio};
    std::string uri_;
    std::string mimeType_;
    std::shared_ptr<const std::vector<u8>> bytes_;
};

const char* mediaKindName(MediaKind kind);

} // namespace rs

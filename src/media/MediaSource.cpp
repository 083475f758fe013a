#include "MediaSource.hpp"

namespace rs {

MediaSource MediaSource::fromUri(std::string uri, MediaKind kind) {
    MediaSource src;
    src.kind_ = kind;
    src.uri_ = std::move(uri);
    return src;
}

MediaSource MediaSource::fromBytes(std::vector<u8> bytes,
                                   std::string mimeType,
                                   MediaKind kind) {
    MediaSource src;
    src.kind_ = kind;
    src.mimeType_ = std::move(mimeType);
    src.bytes_ = std::make_shared<const std::vector<u8>>(std::move(bytes));
    return src;
}

bool MediaSource::isRemote() const {
    return uri_.starts_with("http://") || uri_.starts_with("https://");
}

std::string MediaSource::localPath() const {
    if (inMemory() || isRemote()) {
        return {};
    }
    if (uri_.starts_with("file://")) {
        return uri_.substr(7);
    }
    return uri_;
}

std::string MediaSource::describe() const {
    std::string out = mediaKindName(kind_);
    if (inMemory()) {
        out += " <memory " + std::to_string(bytes_->size()) + " bytes";
        if (!mimeType_.empty()) {
            out += ", " + mimeType_;
        }
        out += ">";
    } else {
        out += " " + uri_;
    }
    return out;
}

const char* mediaKindName(MediaKind kind) {
    switch (kind) {
    case MediaKind::Audio:
        return "audio";
    case MediaKind::Video:
        return "video";
    case MediaKind::Image:
        return "image";
    }
    return "media";
}

} // namespace rs

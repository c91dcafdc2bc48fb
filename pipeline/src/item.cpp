#include "chunkrelay/item.hpp"

#include <stdexcept>

namespace chunkrelay {

const char *to_string(MediaKind kind) noexcept {
    switch (kind) {
    case MediaKind::Text:
        return "text";
    case MediaKind::Video:
        return "video";
    case MediaKind::Photo:
        return "photo";
    case MediaKind::Document:
        return "document";
    case MediaKind::Audio:
        return "audio";
    case MediaKind::Voice:
        return "voice";
    case MediaKind::None:
        break;
    }
    return "none";
}

MediaKind media_kind_from_string(const std::string &name) {
    if (name == "text") {
        return MediaKind::Text;
    }
    if (name == "video") {
        return MediaKind::Video;
    }
    if (name == "photo") {
        return MediaKind::Photo;
    }
    if (name == "document") {
        return MediaKind::Document;
    }
    if (name == "audio") {
        return MediaKind::Audio;
    }
    if (name == "voice") {
        return MediaKind::Voice;
    }
    if (name == "none" || name == "-") {
        return MediaKind::None;
    }
    throw std::invalid_argument("unknown media kind: " + name);
}

MediaKind classify(const std::optional<std::string> &text, const std::optional<MediaDescriptor> &media,
                   MediaKind declared_media_kind) {
    if (media) {
        if (declared_media_kind == MediaKind::Text || declared_media_kind == MediaKind::None) {
            return MediaKind::Document;
        }
        return declared_media_kind;
    }
    if (text && !text->empty()) {
        return MediaKind::Text;
    }
    return MediaKind::None;
}

MediaDescriptor make_media_descriptor(ItemId id, std::uint64_t size_bytes, std::string display_name,
                                      std::string mime_type,
                                      std::vector<std::pair<std::string, std::string>> attributes) {
    MediaDescriptor media;
    media.size_bytes = size_bytes;
    media.display_name = display_name.empty() ? "file_" + std::to_string(id) : std::move(display_name);
    media.mime_type = mime_type.empty() ? "application/octet-stream" : std::move(mime_type);
    media.attributes = std::move(attributes);
    return media;
}

} // namespace chunkrelay

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chunkrelay {

using ItemId = std::int64_t;
using ContainerId = std::string;

enum class MediaKind { Text, Video, Photo, Document, Audio, Voice, None };

const char *to_string(MediaKind kind) noexcept;

MediaKind media_kind_from_string(const std::string &name);

struct MediaDescriptor {
    std::uint64_t size_bytes{0};
    std::string display_name;
    std::string mime_type;
    std::vector<std::pair<std::string, std::string>> attributes;
};

struct Item {
    ItemId id{0};
    std::optional<std::string> text;
    std::optional<MediaDescriptor> media;
    std::optional<ContainerId> topic;
    MediaKind kind{MediaKind::None};
    // Source-side locator of the media object, meaningful to the client only.
    std::string media_ref;
};

// Resolves the kind once, when the item is read from the source.
MediaKind classify(const std::optional<std::string> &text, const std::optional<MediaDescriptor> &media,
                   MediaKind declared_media_kind);

MediaDescriptor make_media_descriptor(ItemId id, std::uint64_t size_bytes, std::string display_name,
                                      std::string mime_type,
                                      std::vector<std::pair<std::string, std::string>> attributes);

} // namespace chunkrelay

#pragma once

#include "chunkrelay/item.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace chunkrelay {

class UploadSession;

class RemoteObjectHandle {
  public:
    const std::string &session_id() const noexcept { return session_id_; }
    std::size_t total_parts() const noexcept { return total_parts_; }
    const std::string &display_name() const noexcept { return display_name_; }
    const std::string &content_hash_hex() const noexcept { return content_hash_hex_; }

  private:
    friend class UploadSession;

    RemoteObjectHandle(std::string session_id, std::size_t total_parts, std::string display_name,
                       std::string content_hash_hex)
        : session_id_(std::move(session_id)), total_parts_(total_parts),
          display_name_(std::move(display_name)), content_hash_hex_(std::move(content_hash_hex)) {}

    std::string session_id_;
    std::size_t total_parts_;
    std::string display_name_;
    std::string content_hash_hex_;
};

struct SendRequest {
    ContainerId container;
    std::optional<ContainerId> reply_to;
    std::string caption;
    MediaKind kind{MediaKind::Text};
    std::optional<MediaDescriptor> media;
    // Text only, inline bytes for the small path, or a finalized upload session.
    std::variant<std::monostate, std::vector<char>, RemoteObjectHandle> body;
};

class ItemCursor {
  public:
    virtual ~ItemCursor() = default;

    virtual std::optional<Item> next() = 0;
};

class ChunkStream {
  public:
    virtual ~ChunkStream() = default;

    // Empty optional once the object is exhausted.
    virtual std::optional<std::vector<char>> next_chunk() = 0;
};

// Client-visible contract of the messaging platform. Implementations report
// pacing with ThrottleError, retryable faults with TransientError and anything
// else with FatalError. upload_part runs on upload worker threads and must
// only throw types derived from std::exception.
class RemoteClient {
  public:
    virtual ~RemoteClient() = default;

    virtual std::unique_ptr<ItemCursor> iterate_items(const ContainerId &container, ItemId min_id) = 0;

    virtual std::vector<char> read_small_object(const Item &item) = 0;

    virtual std::unique_ptr<ChunkStream> open_chunk_stream(const Item &item, std::size_t chunk_size) = 0;

    virtual void upload_part(const std::string &session_id, std::size_t index, std::size_t total_parts,
                             const std::vector<char> &bytes) = 0;

    virtual ItemId send(const SendRequest &request) = 0;

    virtual ContainerId create_topic(const ContainerId &container, const std::string &title) = 0;

    // Drops whatever parts of a session the remote holds. Called for sessions
    // that will never be sent; must not throw.
    virtual void discard_session(const std::string &session_id) noexcept = 0;
};

} // namespace chunkrelay

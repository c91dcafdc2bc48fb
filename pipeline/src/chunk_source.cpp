#include "chunkrelay/chunk_source.hpp"

#include "chunkrelay/errors.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace chunkrelay {

namespace {

std::size_t parts_for(std::uint64_t object_size, std::size_t chunk_size_bytes) {
    return static_cast<std::size_t>((object_size + chunk_size_bytes - 1) / chunk_size_bytes);
}

} // namespace

ChunkReader::ChunkReader(std::unique_ptr<ChunkStream> stream, std::uint64_t object_size,
                         std::size_t chunk_size_bytes)
    : stream_(std::move(stream)), object_size_(object_size), chunk_size_bytes_(chunk_size_bytes),
      total_parts_(parts_for(object_size, chunk_size_bytes)) {
    if (!stream_) {
        throw std::invalid_argument("chunk stream must not be null");
    }
    if (chunk_size_bytes_ == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
}

std::optional<ChunkTask> ChunkReader::next() {
    if (finished_) {
        return std::nullopt;
    }
    auto chunk = stream_->next_chunk();
    if (!chunk) {
        finished_ = true;
        if (bytes_read_ != object_size_) {
            std::ostringstream oss;
            oss << "chunk stream ended after " << bytes_read_ << " of " << object_size_ << " bytes";
            throw FatalError(oss.str());
        }
        return std::nullopt;
    }
    const auto size = chunk->size();
    const auto remaining = object_size_ - bytes_read_;
    const auto expected = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, chunk_size_bytes_));
    if (next_index_ >= total_parts_ || size != expected) {
        finished_ = true;
        std::ostringstream oss;
        oss << "unexpected chunk " << next_index_ << " of " << size << " bytes (expected " << expected
            << ", object " << object_size_ << " bytes)";
        throw FatalError(oss.str());
    }
    bytes_read_ += size;
    return ChunkTask{next_index_++, std::move(*chunk)};
}

ChunkSource::ChunkSource(std::size_t chunk_size_bytes) : chunk_size_bytes_(chunk_size_bytes) {
    if (chunk_size_bytes_ == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
}

std::size_t ChunkSource::total_parts(std::uint64_t object_size) const noexcept {
    return parts_for(object_size, chunk_size_bytes_);
}

ChunkReader ChunkSource::open(RemoteClient &client, const Item &item) const {
    if (!item.media) {
        throw std::invalid_argument("item " + std::to_string(item.id) + " has no media to stream");
    }
    return ChunkReader(client.open_chunk_stream(item, chunk_size_bytes_), item.media->size_bytes,
                       chunk_size_bytes_);
}

std::size_t ChunkSource::chunk_size_bytes() const noexcept { return chunk_size_bytes_; }

} // namespace chunkrelay

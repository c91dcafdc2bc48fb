#pragma once

#include "chunkrelay/item.hpp"
#include "chunkrelay/remote_client.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace chunkrelay {

struct ChunkTask {
    std::size_t index;
    std::vector<char> data;
};

// Pulls one object's chunks in order and checks that they tile the object
// exactly. Single pass: a retry must open a new reader from offset zero.
class ChunkReader {
  public:
    ChunkReader(std::unique_ptr<ChunkStream> stream, std::uint64_t object_size, std::size_t chunk_size_bytes);

    std::optional<ChunkTask> next();

    std::size_t total_parts() const noexcept { return total_parts_; }

    std::uint64_t bytes_read() const noexcept { return bytes_read_; }

  private:
    std::unique_ptr<ChunkStream> stream_;
    std::uint64_t object_size_;
    std::size_t chunk_size_bytes_;
    std::size_t total_parts_;
    std::size_t next_index_{0};
    std::uint64_t bytes_read_{0};
    bool finished_{false};
};

class ChunkSource {
  public:
    explicit ChunkSource(std::size_t chunk_size_bytes);

    std::size_t total_parts(std::uint64_t object_size) const noexcept;

    ChunkReader open(RemoteClient &client, const Item &item) const;

    std::size_t chunk_size_bytes() const noexcept;

  private:
    std::size_t chunk_size_bytes_;
};

} // namespace chunkrelay

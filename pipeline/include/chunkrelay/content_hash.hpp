#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkrelay {

// CRC-32 (IEEE) running hash over an object, fed chunk by chunk in part order.
class ContentHash {
  public:
    ContentHash() = default;

    void update(const char *data, std::size_t size);

    void update(const std::vector<char> &chunk) { update(chunk.data(), chunk.size()); }

    std::uint32_t value() const noexcept;

    std::string hex() const;

    std::uint64_t bytes_hashed() const noexcept { return bytes_; }

    static std::string hex_of(const std::vector<char> &data);

  private:
    std::uint32_t state_{0xFFFFFFFFu};
    std::uint64_t bytes_{0};
};

} // namespace chunkrelay

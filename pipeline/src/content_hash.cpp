#include "chunkrelay/content_hash.hpp"

#include <array>
#include <iomanip>
#include <sstream>

namespace chunkrelay {

namespace {

constexpr std::uint32_t reflected_polynomial = 0xEDB88320u;

constexpr std::array<std::uint32_t, 256> build_table() {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t n = 0; n < table.size(); ++n) {
        std::uint32_t entry = n;
        for (int bit = 0; bit < 8; ++bit) {
            entry = (entry & 1u) ? (entry >> 1) ^ reflected_polynomial : entry >> 1;
        }
        table[n] = entry;
    }
    return table;
}

constexpr auto crc_table = build_table();

std::string to_hex(std::uint32_t value) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0') << std::setw(8) << value;
    return oss.str();
}

} // namespace

void ContentHash::update(const char *data, std::size_t size) {
    if (data == nullptr || size == 0) {
        return;
    }
    auto state = state_;
    for (std::size_t i = 0; i < size; ++i) {
        const auto byte = static_cast<unsigned char>(data[i]);
        state = (state >> 8) ^ crc_table[(state ^ byte) & 0xFFu];
    }
    state_ = state;
    bytes_ += size;
}

std::uint32_t ContentHash::value() const noexcept { return state_ ^ 0xFFFFFFFFu; }

std::string ContentHash::hex() const { return to_hex(value()); }

std::string ContentHash::hex_of(const std::vector<char> &data) {
    ContentHash hash;
    hash.update(data);
    return hash.hex();
}

} // namespace chunkrelay

#include "chunkrelay/chunk_source.hpp"
#include "chunkrelay/errors.hpp"

#include "fake_client.hpp"

#include <cassert>
#include <memory>
#include <stdexcept>
#include <vector>

namespace {

using namespace chunkrelay_test;

class ScriptedStream : public chunkrelay::ChunkStream {
  public:
    explicit ScriptedStream(std::vector<std::size_t> sizes) : sizes_(std::move(sizes)) {}

    std::optional<std::vector<char>> next_chunk() override {
        if (position_ >= sizes_.size()) {
            return std::nullopt;
        }
        return std::vector<char>(sizes_[position_++], 'x');
    }

  private:
    std::vector<std::size_t> sizes_;
    std::size_t position_{0};
};

void splits_object_into_ceil_parts() {
    constexpr std::size_t chunk = 512 * 1024;
    constexpr std::uint64_t size = 5500000;
    chunkrelay::ChunkSource source(chunk);
    assert(source.total_parts(size) == 11);
    assert(source.total_parts(chunk) == 1);
    assert(source.total_parts(chunk + 1) == 2);
    assert(source.total_parts(1) == 1);

    FakeClient client;
    auto item = media_item(1, chunkrelay::MediaKind::Video, size);
    client.add_item(item, pattern_bytes(size));
    auto stored = client.iterate_items("chat", 0)->next();
    auto reader = source.open(client, *stored);
    assert(reader.total_parts() == 11);

    std::size_t expected_index = 0;
    std::size_t last_size = 0;
    while (auto task = reader.next()) {
        assert(task->index == expected_index);
        last_size = task->data.size();
        if (task->index < 10) {
            assert(last_size == chunk);
        }
        ++expected_index;
    }
    assert(expected_index == 11);
    assert(last_size == size - 10 * chunk);
    assert(last_size == 257120);
    assert(reader.bytes_read() == size);
    assert(!reader.next());
}

void short_chunk_before_the_end_aborts() {
    chunkrelay::ChunkReader reader(std::make_unique<ScriptedStream>(std::vector<std::size_t>{100, 40, 100}), 240,
                                   100);
    assert(reader.next()->data.size() == 100);
    bool threw = false;
    try {
        reader.next();
    } catch (const chunkrelay::FatalError &) {
        threw = true;
    }
    assert(threw);
}

void stream_ending_early_aborts() {
    chunkrelay::ChunkReader reader(std::make_unique<ScriptedStream>(std::vector<std::size_t>{100}), 250, 100);
    assert(reader.next());
    bool threw = false;
    try {
        reader.next();
    } catch (const chunkrelay::FatalError &) {
        threw = true;
    }
    assert(threw);
}

void stream_overrunning_size_aborts() {
    chunkrelay::ChunkReader reader(std::make_unique<ScriptedStream>(std::vector<std::size_t>{100, 100}), 100, 100);
    assert(reader.next());
    bool threw = false;
    try {
        reader.next();
    } catch (const chunkrelay::FatalError &) {
        threw = true;
    }
    assert(threw);
}

void zero_chunk_size_is_rejected() {
    bool threw = false;
    try {
        chunkrelay::ChunkSource source(0);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main() {
    splits_object_into_ceil_parts();
    short_chunk_before_the_end_aborts();
    stream_ending_early_aborts();
    stream_overrunning_size_aborts();
    zero_chunk_size_is_rejected();
    return 0;
}

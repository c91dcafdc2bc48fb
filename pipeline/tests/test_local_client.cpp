#include "chunkrelay/checkpoint.hpp"
#include "chunkrelay/errors.hpp"
#include "chunkrelay/local_client.hpp"
#include "chunkrelay/orchestrator.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;

std::vector<char> make_bytes(std::size_t size, unsigned seed) {
    std::vector<char> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 131u + seed) & 0xFFu);
    }
    return data;
}

void write_bytes(const fs::path &path, const std::vector<char> &data) {
    std::ofstream file(path, std::ios::binary);
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
}

std::vector<char> read_bytes(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<char>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

std::vector<std::string> read_lines(const fs::path &path) {
    std::ifstream file(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

void parses_manifest_lines() {
    const fs::path dir = fs::temp_directory_path();
    auto text = chunkrelay::parse_manifest_line("7\t-\ttext\t-\t-\t-\thello world", dir);
    assert(text.id == 7);
    assert(!text.topic);
    assert(text.kind == chunkrelay::MediaKind::Text);
    assert(text.text == std::string("hello world"));
    assert(!text.media);

    auto missing = chunkrelay::parse_manifest_line("8\t3\tvideo\tnot-there.mp4\tvideo/mp4\tduration=3;w=640\t-", dir);
    assert(missing.topic == std::string("3"));
    assert(missing.kind == chunkrelay::MediaKind::Video);
    assert(missing.media->size_bytes == 0);
    assert(missing.media->display_name == "not-there.mp4");
    assert(missing.media->attributes.size() == 2);
    assert(missing.media->attributes[1].first == "w");
    assert(missing.media->attributes[1].second == "640");

    auto empty = chunkrelay::parse_manifest_line("9\t-\tnone\t-\t-\t-", dir);
    assert(empty.kind == chunkrelay::MediaKind::None);

    bool threw = false;
    try {
        chunkrelay::parse_manifest_line("x\t-\ttext", dir);
    } catch (const chunkrelay::FatalError &) {
        threw = true;
    }
    assert(threw);
}

void relays_directory_end_to_end() {
    const auto root = fs::temp_directory_path() / "chunkrelay_local_client_test";
    fs::remove_all(root);
    const auto source_chat = root / "source" / "100";
    fs::create_directories(source_chat);
    const auto small = make_bytes(300, 1);
    const auto large = make_bytes(5000, 2);
    write_bytes(source_chat / "small.jpg", small);
    write_bytes(source_chat / "large.mp4", large);
    {
        std::ofstream manifest(source_chat / "manifest.tsv");
        manifest << "# id\ttopic\tkind\tfile\tmime\tattributes\ttext\n";
        manifest << "1\t-\ttext\t-\t-\t-\tfirst\n";
        manifest << "2\t-\tphoto\tsmall.jpg\timage/jpeg\t-\t-\n";
        manifest << "3\t-\tvideo\tlarge.mp4\tvideo/mp4\tduration=9\tbig one\n";
        manifest << "4\t-\tdocument\tgone.bin\t-\t-\t-\n";
    }

    chunkrelay::RelayConfig config;
    config.source_root = root / "source";
    config.dest_root = root / "dest";
    config.source_chat = "100";
    config.target_chat = "200";
    config.chunk_size_bytes = 512;
    config.parallel_uploads = 4;
    config.small_threshold_bytes = 1024;
    config.min_interval = std::chrono::milliseconds(0);
    config.checkpoint_file = root / "checkpoint.txt";

    chunkrelay::LocalDirectoryClient client(config.source_root, config.dest_root, config.chunk_size_bytes);
    chunkrelay::RateLimiter limiter(config.min_interval);
    chunkrelay::ThrottleRetryHandler retry;
    chunkrelay::Checkpoint checkpoint(config.checkpoint_file);
    chunkrelay::Orchestrator orchestrator(config, client, limiter, retry, checkpoint, nullptr);
    auto stats = orchestrator.run();

    assert(stats.succeeded == 3);
    assert(stats.failed == 1);
    assert(stats.bytes_transferred == small.size() + large.size());
    assert(chunkrelay::Checkpoint(config.checkpoint_file).load() == 4);

    const auto messages = read_lines(config.dest_root / "200" / "messages.tsv");
    assert(messages.size() == 3);
    assert(messages[0] == "1\t-\ttext\t-\tfirst");
    assert(messages[1] == "2\t-\tphoto\t2_small.jpg\t-");
    assert(messages[2] == "3\t-\tvideo\t3_large.mp4\tbig one");
    assert(read_bytes(config.dest_root / "200" / "files" / "2_small.jpg") == small);
    assert(read_bytes(config.dest_root / "200" / "files" / "3_large.mp4") == large);
    assert(fs::is_empty(config.dest_root / ".sessions"));

    fs::remove_all(root);
}

void rejects_inconsistent_parts() {
    const auto root = fs::temp_directory_path() / "chunkrelay_local_parts_test";
    fs::remove_all(root);
    chunkrelay::LocalDirectoryClient client(root / "source", root / "dest", 16);
    client.upload_part("s1", 1, 2, std::vector<char>(4, 'b'));
    client.upload_part("s1", 0, 2, std::vector<char>(16, 'a'));
    auto assembled = read_bytes(client.session_file("s1"));
    assert(assembled.size() == 20);
    assert(assembled[0] == 'a' && assembled[16] == 'b');

    bool threw = false;
    try {
        client.upload_part("s1", 0, 3, std::vector<char>(16, 'a'));
    } catch (const chunkrelay::FatalError &) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        client.upload_part("s2", 0, 1, std::vector<char>(17, 'a'));
    } catch (const chunkrelay::FatalError &) {
        threw = true;
    }
    assert(threw);
    fs::remove_all(root);
}

void manifest_is_read_as_the_cursor_advances() {
    const auto root = fs::temp_directory_path() / "chunkrelay_local_cursor_test";
    fs::remove_all(root);
    fs::create_directories(root / "source" / "chat");
    {
        std::ofstream manifest(root / "source" / "chat" / "manifest.tsv");
        manifest << "1\t-\ttext\t-\t-\t-\tone\n";
        manifest << "2\t-\ttext\t-\t-\t-\ttwo\n";
        manifest << "not a manifest line\n";
        manifest << "5\t-\ttext\t-\t-\t-\tfive\n";
        manifest << "4\t-\ttext\t-\t-\t-\tfour\n";
    }
    chunkrelay::LocalDirectoryClient client(root / "source", root / "dest", 16);

    auto cursor = client.iterate_items("chat", 1);
    assert(cursor->next()->id == 2);
    bool threw = false;
    try {
        cursor->next();
    } catch (const chunkrelay::FatalError &) {
        threw = true;
    }
    assert(threw);

    {
        std::ofstream manifest(root / "source" / "chat" / "manifest.tsv");
        manifest << "5\t-\ttext\t-\t-\t-\tfive\n";
        manifest << "4\t-\ttext\t-\t-\t-\tfour\n";
    }
    auto unordered = client.iterate_items("chat", 0);
    assert(unordered->next()->id == 5);
    threw = false;
    try {
        unordered->next();
    } catch (const chunkrelay::FatalError &) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        client.iterate_items("missing", 0);
    } catch (const chunkrelay::FatalError &) {
        threw = true;
    }
    assert(threw);
    fs::remove_all(root);
}

void discarded_session_leaves_nothing_behind() {
    const auto root = fs::temp_directory_path() / "chunkrelay_local_discard_test";
    fs::remove_all(root);
    chunkrelay::LocalDirectoryClient client(root / "source", root / "dest", 16);
    client.upload_part("s1", 0, 2, std::vector<char>(16, 'a'));
    assert(fs::exists(client.session_file("s1")));
    client.discard_session("s1");
    assert(!fs::exists(client.session_file("s1")));
    assert(fs::is_empty(root / "dest" / ".sessions"));

    // The part count is forgotten with the session.
    client.upload_part("s1", 0, 3, std::vector<char>(16, 'a'));
    client.discard_session("s1");
    client.discard_session("never-started");
    assert(fs::is_empty(root / "dest" / ".sessions"));
    fs::remove_all(root);
}

} // namespace

int main() {
    parses_manifest_lines();
    relays_directory_end_to_end();
    rejects_inconsistent_parts();
    manifest_is_read_as_the_cursor_advances();
    discarded_session_leaves_nothing_behind();
    return 0;
}

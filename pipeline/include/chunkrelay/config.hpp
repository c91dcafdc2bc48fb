#pragma once

#include "chunkrelay/item.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chunkrelay {

struct RelayConfig {
    std::filesystem::path source_root;
    std::filesystem::path dest_root;
    ContainerId source_chat;
    ContainerId target_chat;
    std::optional<ContainerId> source_topic;
    std::optional<ContainerId> target_topic;
    bool auto_create_topics{false};
    std::size_t chunk_size_bytes{512 * 1024};
    std::size_t parallel_uploads{10};
    std::chrono::milliseconds min_interval{2500};
    std::uint64_t small_threshold_bytes{10 * 1024 * 1024};
    std::size_t max_transient_retries{3};
    std::filesystem::path checkpoint_file{"checkpoint.txt"};
    std::filesystem::path topic_map_file{"topic_map.tsv"};
};

// Parses options only; argv[0] must already be stripped.
RelayConfig parse_relay_config(int argc, char **argv);

std::string relay_usage();

} // namespace chunkrelay

#include "chunkrelay/config.hpp"

#include "chunkrelay/errors.hpp"

#include <sstream>

namespace chunkrelay {

namespace {

std::uint64_t parse_positive(const std::string &option, const std::string &value) {
    std::size_t parsed = 0;
    unsigned long long number = 0;
    try {
        number = std::stoull(value, &parsed);
    } catch (const std::exception &) {
        parsed = 0;
    }
    if (parsed == 0 || parsed != value.size() || value.front() == '-' || number == 0) {
        throw ConfigError(option + " expects a positive integer, got '" + value + "'");
    }
    return static_cast<std::uint64_t>(number);
}

std::optional<ContainerId> optional_id(const std::string &value) {
    if (value.empty() || value == "-") {
        return std::nullopt;
    }
    return value;
}

} // namespace

RelayConfig parse_relay_config(int argc, char **argv) {
    RelayConfig config;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--source-root" && has_value) {
            config.source_root = argv[++i];
        } else if (arg == "--dest-root" && has_value) {
            config.dest_root = argv[++i];
        } else if (arg == "--source-chat" && has_value) {
            config.source_chat = argv[++i];
        } else if (arg == "--target-chat" && has_value) {
            config.target_chat = argv[++i];
        } else if (arg == "--source-topic" && has_value) {
            config.source_topic = optional_id(argv[++i]);
        } else if (arg == "--target-topic" && has_value) {
            config.target_topic = optional_id(argv[++i]);
        } else if (arg == "--auto-create-topics") {
            config.auto_create_topics = true;
        } else if (arg == "--chunk-size" && has_value) {
            config.chunk_size_bytes = static_cast<std::size_t>(parse_positive(arg, argv[++i]));
        } else if (arg == "--parallel-uploads" && has_value) {
            config.parallel_uploads = static_cast<std::size_t>(parse_positive(arg, argv[++i]));
        } else if (arg == "--min-interval-ms" && has_value) {
            std::string value = argv[++i];
            config.min_interval =
                std::chrono::milliseconds(value == "0" ? 0 : static_cast<long long>(parse_positive(arg, value)));
        } else if (arg == "--small-threshold" && has_value) {
            config.small_threshold_bytes = parse_positive(arg, argv[++i]);
        } else if (arg == "--max-transient-retries" && has_value) {
            std::string value = argv[++i];
            config.max_transient_retries = value == "0" ? 0 : static_cast<std::size_t>(parse_positive(arg, value));
        } else if (arg == "--checkpoint-file" && has_value) {
            config.checkpoint_file = argv[++i];
        } else if (arg == "--topic-map-file" && has_value) {
            config.topic_map_file = argv[++i];
        } else {
            std::ostringstream oss;
            oss << "unknown or incomplete option: " << arg;
            throw ConfigError(oss.str());
        }
    }
    if (config.source_root.empty() || config.dest_root.empty() || config.source_chat.empty() ||
        config.target_chat.empty()) {
        throw ConfigError("missing required options (--source-root, --dest-root, --source-chat, --target-chat)");
    }
    return config;
}

std::string relay_usage() {
    return "Usage:\n"
           "  chunkrelay --source-root <dir> --dest-root <dir> --source-chat <id> --target-chat <id>\n"
           "             [--source-topic <id>] [--target-topic <id>] [--auto-create-topics]\n"
           "             [--chunk-size <bytes>] [--parallel-uploads <n>] [--min-interval-ms <ms>]\n"
           "             [--small-threshold <bytes>] [--max-transient-retries <n>]\n"
           "             [--checkpoint-file <path>] [--topic-map-file <path>]\n";
}

} // namespace chunkrelay

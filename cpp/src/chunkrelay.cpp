#include "chunkrelay/checkpoint.hpp"
#include "chunkrelay/config.hpp"
#include "chunkrelay/container_map.hpp"
#include "chunkrelay/errors.hpp"
#include "chunkrelay/local_client.hpp"
#include "chunkrelay/orchestrator.hpp"
#include "chunkrelay/rate_limiter.hpp"
#include "chunkrelay/throttle_retry.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

int run_relay(const chunkrelay::RelayConfig &config) {
    chunkrelay::LocalDirectoryClient client(config.source_root, config.dest_root, config.chunk_size_bytes);
    chunkrelay::RateLimiter limiter(config.min_interval);
    chunkrelay::RetryPolicy policy;
    policy.max_transient_retries = config.max_transient_retries;
    chunkrelay::ThrottleRetryHandler retry(policy);
    chunkrelay::Checkpoint checkpoint(config.checkpoint_file);

    std::unique_ptr<chunkrelay::ContainerMap> topics;
    if (config.auto_create_topics) {
        topics = std::make_unique<chunkrelay::ContainerMap>(config.topic_map_file);
        topics->load();
        std::cout << "loaded " << topics->size() << " topic mappings" << std::endl;
    }

    chunkrelay::Orchestrator orchestrator(config, client, limiter, retry, checkpoint, topics.get());
    orchestrator.run();
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char **argv) {
    if (argc >= 2) {
        std::string first = argv[1];
        if (first == "--help" || first == "-h") {
            std::cout << chunkrelay::relay_usage();
            return EXIT_SUCCESS;
        }
    }
    try {
        auto config = chunkrelay::parse_relay_config(argc - 1, argv + 1);
        return run_relay(config);
    } catch (const chunkrelay::ConfigError &err) {
        std::cerr << "error: " << err.what() << std::endl;
        std::cerr << chunkrelay::relay_usage();
        return EXIT_FAILURE;
    } catch (const std::exception &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}

#pragma once

#include "chunkrelay/checkpoint.hpp"
#include "chunkrelay/chunk_source.hpp"
#include "chunkrelay/config.hpp"
#include "chunkrelay/container_map.hpp"
#include "chunkrelay/rate_limiter.hpp"
#include "chunkrelay/remote_client.hpp"
#include "chunkrelay/throttle_retry.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace chunkrelay {

struct RunStatistics {
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::uint64_t bytes_transferred{0};
    std::chrono::steady_clock::time_point started{std::chrono::steady_clock::now()};

    std::size_t concluded() const noexcept { return succeeded + failed; }

    double elapsed_minutes() const;

    double items_per_minute() const;
};

enum class ItemOutcome { Succeeded, Failed };

class Orchestrator {
  public:
    // container_map may be null when topics are not mirrored.
    Orchestrator(const RelayConfig &config, RemoteClient &client, RateLimiter &limiter,
                 ThrottleRetryHandler &retry, Checkpoint &checkpoint, ContainerMap *container_map);

    // Relays every item after the checkpoint. Per-item failures are counted;
    // checkpoint and iteration failures end the run and propagate.
    RunStatistics run();

    bool accepts(const Item &item) const;

    ItemOutcome process_item(const Item &item);

    const RunStatistics &statistics() const noexcept { return stats_; }

  private:
    std::optional<ContainerId> resolve_destination(const Item &item);
    void send_text(const Item &item, const std::optional<ContainerId> &reply_to);
    void send_small(const Item &item, const std::optional<ContainerId> &reply_to);
    void send_streamed(const Item &item, const std::optional<ContainerId> &reply_to);
    SendRequest make_request(const Item &item, const std::optional<ContainerId> &reply_to) const;
    ItemId send(const std::string &what, const SendRequest &request);
    void log_progress() const;
    void log_summary() const;

    const RelayConfig &config_;
    RemoteClient &client_;
    RateLimiter &limiter_;
    ThrottleRetryHandler &retry_;
    Checkpoint &checkpoint_;
    ContainerMap *container_map_;
    ChunkSource chunk_source_;
    RunStatistics stats_;
};

} // namespace chunkrelay

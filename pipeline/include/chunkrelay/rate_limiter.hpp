#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

namespace chunkrelay {

// Spaces granted turns at least min_interval apart. Callers are served in
// arrival order. One instance per destination endpoint.
class RateLimiter {
  public:
    using clock = std::chrono::steady_clock;

    explicit RateLimiter(std::chrono::milliseconds min_interval);

    void wait_turn();

    std::chrono::milliseconds min_interval() const noexcept { return min_interval_; }

    std::optional<clock::time_point> last_turn() const;

  private:
    std::chrono::milliseconds min_interval_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::uint64_t next_ticket_{0};
    std::uint64_t serving_{0};
    std::optional<clock::time_point> last_turn_;
};

} // namespace chunkrelay

#pragma once

#include "chunkrelay/errors.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <iostream>
#include <string>

namespace chunkrelay {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper thread_sleeper();

struct RetryPolicy {
    std::chrono::milliseconds throttle_margin{1000};
    std::chrono::milliseconds transient_backoff{1000};
    std::size_t max_transient_retries{3};
};

// Replays an operation after remote throttling for as long as the remote keeps
// throttling. Thread-safe; upload workers share one instance.
class ThrottleRetryHandler {
  public:
    explicit ThrottleRetryHandler(RetryPolicy policy = RetryPolicy{}, Sleeper sleeper = thread_sleeper());

    // Retries ThrottleError only. Everything else propagates unchanged.
    template <typename Op> decltype(auto) run(const std::string &what, Op &&op) {
        while (true) {
            try {
                return op();
            } catch (const ThrottleError &e) {
                const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(e.wait()) +
                                  policy_.throttle_margin;
                ++throttle_waits_;
                std::cerr << "throttled on " << what << ", waiting " << wait.count() << " ms" << std::endl;
                sleeper_(wait);
            }
        }
    }

    // As run(), and also retries TransientError up to max_transient_retries times.
    template <typename Op> decltype(auto) run_with_retries(const std::string &what, Op &&op) {
        std::size_t failures = 0;
        while (true) {
            try {
                return run(what, op);
            } catch (const TransientError &e) {
                if (failures >= policy_.max_transient_retries) {
                    throw;
                }
                ++failures;
                ++transient_retries_;
                std::cerr << "transient error on " << what << " (retry " << failures << "/"
                          << policy_.max_transient_retries << "): " << e.what() << std::endl;
                sleeper_(policy_.transient_backoff);
            }
        }
    }

    const RetryPolicy &policy() const noexcept { return policy_; }

    std::size_t throttle_waits() const noexcept { return throttle_waits_.load(); }

    std::size_t transient_retries() const noexcept { return transient_retries_.load(); }

  private:
    RetryPolicy policy_;
    Sleeper sleeper_;
    std::atomic<std::size_t> throttle_waits_{0};
    std::atomic<std::size_t> transient_retries_{0};
};

} // namespace chunkrelay

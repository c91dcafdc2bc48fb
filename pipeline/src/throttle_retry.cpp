#include "chunkrelay/throttle_retry.hpp"

#include <thread>

namespace chunkrelay {

Sleeper thread_sleeper() {
    return [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
}

ThrottleRetryHandler::ThrottleRetryHandler(RetryPolicy policy, Sleeper sleeper)
    : policy_(policy), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        throw std::invalid_argument("sleeper must be callable");
    }
}

} // namespace chunkrelay

#include "chunkrelay/rate_limiter.hpp"

#include <stdexcept>
#include <thread>

namespace chunkrelay {

RateLimiter::RateLimiter(std::chrono::milliseconds min_interval) : min_interval_(min_interval) {
    if (min_interval_.count() < 0) {
        throw std::invalid_argument("min interval must be >= 0");
    }
}

void RateLimiter::wait_turn() {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto ticket = next_ticket_++;
    cv_.wait(lock, [&] { return serving_ == ticket; });
    if (last_turn_) {
        const auto earliest = *last_turn_ + min_interval_;
        lock.unlock();
        std::this_thread::sleep_until(earliest);
        lock.lock();
    }
    last_turn_ = clock::now();
    ++serving_;
    lock.unlock();
    cv_.notify_all();
}

std::optional<RateLimiter::clock::time_point> RateLimiter::last_turn() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_turn_;
}

} // namespace chunkrelay

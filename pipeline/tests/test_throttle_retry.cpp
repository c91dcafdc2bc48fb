#include "chunkrelay/errors.hpp"
#include "chunkrelay/throttle_retry.hpp"

#include "fake_client.hpp"

#include <cassert>
#include <string>

namespace {

using chunkrelay_test::RecordingSleeper;

void throttle_is_replayed_until_it_clears() {
    RecordingSleeper sleeper;
    chunkrelay::ThrottleRetryHandler retry(chunkrelay::RetryPolicy{}, sleeper.sleeper());
    int calls = 0;
    const int result = retry.run("send", [&] {
        ++calls;
        if (calls <= 2) {
            throw chunkrelay::ThrottleError(std::chrono::seconds(5), "FLOOD_WAIT_5");
        }
        return 7;
    });
    assert(result == 7);
    assert(calls == 3);
    const auto sleeps = sleeper.sleeps();
    assert(sleeps.size() == 2);
    for (const auto &sleep : sleeps) {
        assert(sleep == std::chrono::milliseconds(6000));
    }
    assert(retry.throttle_waits() == 2);
}

void other_errors_propagate_unchanged() {
    RecordingSleeper sleeper;
    chunkrelay::ThrottleRetryHandler retry(chunkrelay::RetryPolicy{}, sleeper.sleeper());
    int calls = 0;
    bool threw = false;
    try {
        retry.run("send", [&] {
            ++calls;
            throw chunkrelay::FatalError("MEDIA_INVALID");
        });
    } catch (const chunkrelay::FatalError &e) {
        threw = std::string(e.what()) == "MEDIA_INVALID";
    }
    assert(threw);
    assert(calls == 1);

    calls = 0;
    threw = false;
    try {
        retry.run("send", [&] {
            ++calls;
            throw chunkrelay::TransientError("timeout");
        });
    } catch (const chunkrelay::TransientError &) {
        threw = true;
    }
    assert(threw);
    assert(calls == 1);
    assert(sleeper.sleeps().empty());
}

void transient_errors_are_bounded() {
    RecordingSleeper sleeper;
    chunkrelay::RetryPolicy policy;
    policy.max_transient_retries = 2;
    policy.transient_backoff = std::chrono::milliseconds(250);
    chunkrelay::ThrottleRetryHandler retry(policy, sleeper.sleeper());
    int calls = 0;
    bool threw = false;
    try {
        retry.run_with_retries("upload", [&] {
            ++calls;
            throw chunkrelay::TransientError("timeout");
        });
    } catch (const chunkrelay::TransientError &) {
        threw = true;
    }
    assert(threw);
    assert(calls == 3);
    assert(sleeper.sleeps().size() == 2);
    assert(sleeper.sleeps()[0] == std::chrono::milliseconds(250));
    assert(retry.transient_retries() == 2);
}

void throttle_does_not_consume_transient_retries() {
    RecordingSleeper sleeper;
    chunkrelay::RetryPolicy policy;
    policy.max_transient_retries = 1;
    policy.throttle_margin = std::chrono::milliseconds(0);
    chunkrelay::ThrottleRetryHandler retry(policy, sleeper.sleeper());
    int calls = 0;
    retry.run_with_retries("upload", [&] {
        ++calls;
        if (calls <= 4) {
            throw chunkrelay::ThrottleError(std::chrono::seconds(1), "FLOOD_WAIT_1");
        }
        if (calls == 5) {
            throw chunkrelay::TransientError("reset");
        }
    });
    assert(calls == 6);
    assert(retry.throttle_waits() == 4);
    assert(retry.transient_retries() == 1);
}

} // namespace

int main() {
    throttle_is_replayed_until_it_clears();
    other_errors_propagate_unchanged();
    transient_errors_are_bounded();
    throttle_does_not_consume_transient_retries();
    return 0;
}

#pragma once

#include "error.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <thread>
#include <type_traits>

// Fixed attempt count, fixed delay between attempts. No backoff, no jitter.
struct RetryPolicy {
    int max_attempts = 10;
    std::chrono::milliseconds delay{1000};
};

// Calls fn() (returning Result<T>) until it succeeds or the attempts run out.
// Sleeps `delay` between attempts, never after the last one. On exhaustion the
// last error is reported as a ConnectionError.
template <class Fn>
std::invoke_result_t<Fn&> with_retry(const RetryPolicy& policy, Fn&& fn) {
    int attempts = std::max(policy.max_attempts, 1);
    Error last{ErrorKind::Connection, "no attempt made"};

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto res = fn();
        if (res) return res;
        last = std::move(res.error());
        if (attempt < attempts) {
            std::this_thread::sleep_for(policy.delay);
        }
    }

    return std::unexpected(Error{
        ErrorKind::Connection,
        std::format("{} (gave up after {} attempts)", last.message, attempts),
    });
}

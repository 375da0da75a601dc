#pragma once

#include "enricher/async_database.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace enricher {

/**
 * RetryPolicy - exponential backoff for database round-trips
 *
 * Only DbError with a Transient class is retried. The delay before retry n
 * (0-based) is base_delay_ms * 2^n, so the defaults give 1s, 2s, 4s and at
 * most max_retries + 1 attempts in total. Integrity and other failures are
 * rethrown on the first occurrence.
 */
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RetryPolicy(int max_retries = 3, int base_delay_ms = 1000)
        : max_retries_(max_retries), base_delay_ms_(base_delay_ms),
          sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

    // Tests swap in a recording sleeper.
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    int max_retries() const { return max_retries_; }

    std::chrono::milliseconds delay_for(int retry) const {
        return std::chrono::milliseconds(static_cast<long long>(base_delay_ms_) << retry);
    }

    template <typename Fn>
    auto run(const std::string& label, Fn&& fn) const -> decltype(fn()) {
        for (int attempt = 0;; ++attempt) {
            try {
                return fn();
            } catch (const DbError& e) {
                if (!e.is_transient() || attempt >= max_retries_) {
                    throw;
                }
                auto delay = delay_for(attempt);
                spdlog::warn("[RetryPolicy] {} failed (attempt {}/{}, {}): {}. Retrying in {}ms",
                             label, attempt + 1, max_retries_ + 1,
                             to_string(e.error_class()), e.what(), delay.count());
                sleeper_(delay);
            }
        }
    }

private:
    int max_retries_;
    int base_delay_ms_;
    Sleeper sleeper_;
};

} // namespace enricher

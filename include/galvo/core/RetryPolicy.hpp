#pragma once

#include "galvo/core/Expected.hpp"

#include <chrono>
#include <thread>
#include <type_traits>

namespace galvo::core {

/// What the caller's recovery hook decided after a failed attempt.
enum class RetryStep {
    Retry,      ///< recovered already, try again at once
    Backoff,    ///< sleep the policy backoff, then try again
    GiveUp      ///< stop now and return the failure
};

/**
 * @brief Bounded retry with a fixed sleep, shared by transfers and connects.
 *
 * `run()` calls `attempt(n)` (n counts from 1) until it succeeds or
 * `maxAttempts` calls have failed. Between two attempts `recover(error)`
 * decides how to continue. When the last allowed attempt fails,
 * `exhausted(error)` runs once and its result is returned, which lets the
 * caller translate or annotate the final error.
 */
class RetryPolicy {
public:
    using duration = std::chrono::milliseconds;

    constexpr RetryPolicy() = default;
    constexpr RetryPolicy(int attempts, duration sleep)
    : maxAttempts(attempts < 1 ? 1 : attempts)
    , backoff(sleep.count() < 0 ? duration::zero() : sleep) {}

    int maxAttempts = 1;
    duration backoff{0};

    template <typename Attempt, typename Recover, typename Exhausted>
    auto run(Attempt&& attempt, Recover&& recover, Exhausted&& exhausted) const
        -> std::invoke_result_t<Attempt&, int> {
        for (int n = 1;; ++n) {
            auto result = attempt(n);
            if (result) {
                return result;
            }
            if (n >= maxAttempts) {
                return exhausted(result.error());
            }
            switch (recover(result.error())) {
                case RetryStep::Retry:
                    break;
                case RetryStep::Backoff:
                    sleep();
                    break;
                case RetryStep::GiveUp:
                    return result;
            }
        }
    }

    template <typename Attempt, typename Recover>
    auto run(Attempt&& attempt, Recover&& recover) const
        -> std::invoke_result_t<Attempt&, int> {
        using Result = std::invoke_result_t<Attempt&, int>;
        return run(std::forward<Attempt>(attempt), std::forward<Recover>(recover),
                   [](const std::error_code& ec) -> Result { return galvo::unexpected(ec); });
    }

    void sleep() const {
        if (backoff.count() > 0) {
            std::this_thread::sleep_for(backoff);
        }
    }
};

} // namespace galvo::core

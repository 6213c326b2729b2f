#pragma once

#include "chunkio/errors.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <type_traits>

namespace chunkio
{
    struct RetryConfig
    {
        int max_attempts = 3;
        std::chrono::milliseconds initial_delay{100};
        double backoff_multiplier = 2.0;
        std::chrono::milliseconds max_delay{5000};
    };

    // (attempt that failed, delay before the next one, what it threw)
    using RetryCallback = std::function<void(int, std::chrono::milliseconds, const std::exception &)>;
    using WaitFunction = std::function<void(std::chrono::milliseconds)>;
    // False for failures that will not go away on another attempt; those are
    // rethrown unchanged instead of being retried.
    using RetryFilter = std::function<bool(const std::exception &)>;

    // Backoff bookkeeping for one retried operation, without any waiting.
    // Callers running an event loop drive it themselves: run an attempt, and on
    // failure ask on_failure() how long to wait before scheduling the next one.
    class RetrySchedule
    {
    public:
        explicit RetrySchedule(const RetryConfig &config);

        // Records the failure of the current attempt and returns the delay to
        // wait before the next one. Throws RetryExhausted carrying `error` once
        // max_attempts attempts have failed.
        std::chrono::milliseconds on_failure(std::exception_ptr error);

        // 1-based index of the attempt about to run (or running)
        int attempt() const noexcept { return attempt_; }
        std::chrono::milliseconds next_delay() const noexcept { return delay_; }

    private:
        RetryConfig config_;
        int attempt_ = 1;
        std::chrono::milliseconds delay_;
    };

    class RetryPolicy
    {
    public:
        // Throws ConfigError unless max_attempts >= 1, initial_delay >= 0,
        // backoff_multiplier >= 1 and max_delay >= initial_delay.
        explicit RetryPolicy(RetryConfig config = {});
        RetryPolicy(int max_attempts,
                    std::chrono::milliseconds initial_delay,
                    double backoff_multiplier,
                    std::chrono::milliseconds max_delay);

        RetrySchedule schedule() const { return RetrySchedule(config_); }

        // Runs `operation` until it returns or max_attempts attempts have thrown.
        // Between attempts on_retry (if set) is notified and `wait` is called
        // with the delay; without a wait function the calling thread sleeps.
        // Without a filter every std::exception is retried.
        template <typename Operation>
        std::invoke_result_t<Operation &> execute(Operation &&operation,
                                                  const RetryCallback &on_retry = {},
                                                  const WaitFunction &wait = {},
                                                  const RetryFilter &retryable = {}) const
        {
            RetrySchedule sched = schedule();
            while (true)
            {
                try
                {
                    return operation();
                }
                catch (const std::exception &e)
                {
                    if (retryable && !retryable(e))
                        throw;
                    const int failed = sched.attempt();
                    const auto delay = sched.on_failure(std::current_exception());
                    if (on_retry)
                        on_retry(failed, delay, e);
                    if (wait)
                        wait(delay);
                    else
                        blocking_wait(delay);
                }
            }
        }

        int max_attempts() const noexcept { return config_.max_attempts; }
        std::chrono::milliseconds initial_delay() const noexcept { return config_.initial_delay; }
        double backoff_multiplier() const noexcept { return config_.backoff_multiplier; }
        std::chrono::milliseconds max_delay() const noexcept { return config_.max_delay; }
        const RetryConfig &config() const noexcept { return config_; }

        static void blocking_wait(std::chrono::milliseconds delay);

    private:
        RetryConfig config_;
    };
}

#include "chunkio/retry_policy.hpp"
#include <string>
#include <thread>

namespace chunkio
{
    namespace
    {
        std::string describe(const std::exception_ptr &error)
        {
            try
            {
                if (error)
                    std::rethrow_exception(error);
            }
            catch (const std::exception &e)
            {
                return e.what();
            }
            return "unknown error";
        }
    }

    RetrySchedule::RetrySchedule(const RetryConfig &config)
        : config_(config), delay_(config.initial_delay)
    {
    }

    std::chrono::milliseconds RetrySchedule::on_failure(std::exception_ptr error)
    {
        if (attempt_ >= config_.max_attempts)
        {
            // built before the throw: the exception_ptr is moved into the exception
            const std::string message = "Operation failed after " + std::to_string(attempt_) +
                                        " attempts: " + describe(error);
            throw RetryExhausted(message, std::move(error), attempt_);
        }

        const auto current = delay_;
        // computed in double and capped before converting back, so large
        // multipliers cannot overflow the tick count
        const double grown = static_cast<double>(delay_.count()) * config_.backoff_multiplier;
        if (grown >= static_cast<double>(config_.max_delay.count()))
            delay_ = config_.max_delay;
        else
            delay_ = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(grown));
        ++attempt_;
        return current;
    }

    RetryPolicy::RetryPolicy(RetryConfig config) : config_(config)
    {
        if (config_.max_attempts < 1)
            throw ConfigError("max_attempts must be at least 1");
        if (config_.initial_delay.count() < 0)
            throw ConfigError("initial_delay must not be negative");
        if (!(config_.backoff_multiplier >= 1.0))
            throw ConfigError("backoff_multiplier must be at least 1.0");
        if (config_.max_delay < config_.initial_delay)
            throw ConfigError("max_delay must not be smaller than initial_delay");
    }

    RetryPolicy::RetryPolicy(int max_attempts,
                             std::chrono::milliseconds initial_delay,
                             double backoff_multiplier,
                             std::chrono::milliseconds max_delay)
        : RetryPolicy(RetryConfig{max_attempts, initial_delay, backoff_multiplier, max_delay})
    {
    }

    void RetryPolicy::blocking_wait(std::chrono::milliseconds delay)
    {
        if (delay.count() > 0)
            std::this_thread::sleep_for(delay);
    }
}

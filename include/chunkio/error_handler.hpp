#pragma once

#include "chunkio/retry_policy.hpp"
#include "chunkio/utils.hpp"

#include <exception>
#include <string>
#include <utility>

namespace chunkio
{
    // Pairs a RetryPolicy with the logger: every retry is reported as a warning
    // tagged with a short description of the operation. ConfigError and
    // DecodeError are permanent and propagate from the first attempt.
    class ErrorHandler
    {
    public:
        explicit ErrorHandler(RetryPolicy policy = RetryPolicy{}) : policy_(std::move(policy)) {}

        template <typename Operation>
        std::invoke_result_t<Operation &> execute_with_retry(Operation &&operation, const std::string &context) const
        {
            return policy_.execute(std::forward<Operation>(operation),
                                   [&context](int attempt, std::chrono::milliseconds delay, const std::exception &e)
                                   {
                                       utils::Logger::log(utils::Logger::Level::WARNING,
                                                          context + " failed (attempt " + std::to_string(attempt) +
                                                              "), retrying in " + std::to_string(delay.count()) +
                                                              "ms: " + e.what());
                                   },
                                   {}, &ErrorHandler::is_transient);
        }

        // False for bad settings and corrupt input, true for everything else
        static bool is_transient(const std::exception &error);

        static void log_error(const std::exception &error, const std::string &context);

        const RetryPolicy &policy() const noexcept { return policy_; }

    private:
        RetryPolicy policy_;
    };
}

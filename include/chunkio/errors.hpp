#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace chunkio
{
    // Invalid configuration: algorithm, level, chunk size, retry settings.
    // Raised while constructing an object or parsing a setting, never by an
    // operation on a built one. Never retried.
    class ConfigError : public std::invalid_argument
    {
    public:
        explicit ConfigError(const std::string &what) : std::invalid_argument(what) {}
    };

    // Failure reported by the file system layer. Carries errno; short reads and
    // writes use EIO, use of a closed handle uses EBADF.
    class IOError : public std::system_error
    {
    public:
        IOError(int err, const std::string &what)
            : std::system_error(err, std::generic_category(), what) {}
    };

    // Malformed or truncated compressed input. Never retried.
    class DecodeError : public std::runtime_error
    {
    public:
        explicit DecodeError(const std::string &what) : std::runtime_error(what) {}
    };

    class RetryExhausted : public std::runtime_error
    {
    public:
        RetryExhausted(const std::string &what, std::exception_ptr last_error, int attempts)
            : std::runtime_error(what), last_error_(std::move(last_error)), attempts_(attempts) {}

        // The exception thrown by the final attempt
        std::exception_ptr last_error() const noexcept { return last_error_; }
        int attempts() const noexcept { return attempts_; }

    private:
        std::exception_ptr last_error_;
        int attempts_;
    };
}

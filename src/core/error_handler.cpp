#include "chunkio/error_handler.hpp"
#include "chunkio/errors.hpp"
#include <system_error>

namespace chunkio
{
    bool ErrorHandler::is_transient(const std::exception &error)
    {
        return dynamic_cast<const ConfigError *>(&error) == nullptr &&
               dynamic_cast<const DecodeError *>(&error) == nullptr;
    }

    void ErrorHandler::log_error(const std::exception &error, const std::string &context)
    {
        std::string message = context + ": " + error.what();

        if (const auto *sys = dynamic_cast<const std::system_error *>(&error))
            message += " (errno " + std::to_string(sys->code().value()) + ")";

        if (const auto *exhausted = dynamic_cast<const RetryExhausted *>(&error))
            message += " [" + std::to_string(exhausted->attempts()) + " attempts]";

        utils::Logger::log(utils::Logger::Level::ERROR, message);
    }
}

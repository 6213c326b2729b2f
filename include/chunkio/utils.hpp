#pragma once
#include "chunkio/file_handler.hpp"
#include <string>

namespace chunkio::utils
{
    [[nodiscard]] bool file_exists(const std::string &p);

    // Parses a whole decimal integer in [min, max]. Anything else, including
    // trailing junk and out-of-range values, is a ConfigError naming `flag`.
    long long parse_number(const std::string &flag, const std::string &value, long long min, long long max);

    // "<prefix> [=====>    ] 42% <suffix>", 50 cells wide
    std::string render_progress(int percent, const std::string &prefix = "", const std::string &suffix = "");
    void progress_bar(int percent, const std::string &prefix = "", const std::string &suffix = "");
    // Draws one step of a chunked write, with the running byte count as suffix
    void progress_bar(const WriteProgress &progress, const std::string &prefix = "");

    class Logger
    {
    public:
        enum class Level
        {
            DEBUG,
            INFO,
            WARNING,
            ERROR
        };

        static void log(Level level, const std::string &message);

        // Messages below this level are dropped. Defaults to INFO.
        static void set_level(Level level);
    };
}

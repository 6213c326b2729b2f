#include "chunkio/utils.hpp"
#include "chunkio/errors.hpp"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <filesystem>
#include <stdexcept>

namespace chunkio::utils
{
    namespace
    {
        std::atomic<Logger::Level> min_level{Logger::Level::INFO};

        const char *level_name(Logger::Level level)
        {
            switch (level)
            {
            case Logger::Level::DEBUG:
                return "DEBUG";
            case Logger::Level::INFO:
                return "INFO";
            case Logger::Level::WARNING:
                return "WARNING";
            case Logger::Level::ERROR:
                return "ERROR";
            }
            return "";
        }
    }

    bool file_exists(const std::string &p)
    {
        return std::filesystem::exists(p);
    }

    long long parse_number(const std::string &flag, const std::string &value, long long min, long long max)
    {
        const std::string range = " (expected " + std::to_string(min) + ".." + std::to_string(max) + ")";
        long long number = 0;
        size_t used = 0;
        try
        {
            number = std::stoll(value, &used, 10);
        }
        catch (const std::invalid_argument &)
        {
            throw ConfigError("Invalid value for " + flag + ": '" + value + "' is not a number");
        }
        catch (const std::out_of_range &)
        {
            throw ConfigError("Invalid value for " + flag + ": " + value + range);
        }
        if (used != value.size())
            throw ConfigError("Invalid value for " + flag + ": '" + value + "' is not a number");
        if (number < min || number > max)
            throw ConfigError("Invalid value for " + flag + ": " + value + range);
        return number;
    }

    void Logger::set_level(Level level)
    {
        min_level.store(level);
    }

    void Logger::log(Level level, const std::string &message)
    {
        if (level < min_level.load())
            return;
        std::cerr << "[" << level_name(level) << "] " << message << "\n";
    }

    std::string render_progress(int percent, const std::string &prefix, const std::string &suffix)
    {
        const int barWidth = 50;
        percent = std::clamp(percent, 0, 100);
        const int pos = barWidth * percent / 100;

        std::string line = prefix + " [";
        for (int i = 0; i < barWidth; ++i)
        {
            if (i < pos)
                line += '=';
            else if (i == pos)
                line += '>';
            else
                line += ' ';
        }
        line += "] " + std::to_string(percent) + "% " + suffix;
        return line;
    }

    void progress_bar(int percent, const std::string &prefix, const std::string &suffix)
    {
        std::cerr << "\r" << render_progress(percent, prefix, suffix);
        std::cerr.flush();
        if (percent >= 100)
            std::cerr << "\n";
    }

    void progress_bar(const WriteProgress &progress, const std::string &prefix)
    {
        progress_bar(static_cast<int>(progress.percent_complete), prefix,
                     "(" + std::to_string(progress.total_written) + " bytes)");
    }
}

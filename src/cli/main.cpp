#include "chunkio/compression.hpp"
#include "chunkio/digest.hpp"
#include "chunkio/error_handler.hpp"
#include "chunkio/file_handler.hpp"
#include "chunkio/utils.hpp"
#include <algorithm>
#include <array>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace chunkio;

namespace
{
    const char *VERSION = "0.3.0";
    constexpr long long MAX_CHUNK_SIZE = 1LL << 30;
    constexpr long long MAX_ATTEMPTS = 100;
}

enum ExitCodes
{
    SUCCESS = 0,
    INVALID_USAGE = 1,
    RUNTIME_ERROR = 2,
    VERIFY_FAILED = 3
};

static void usage()
{
    utils::Logger::log(utils::Logger::Level::INFO, std::string("chunkio ") + VERSION + ": chunked file streaming and compression");
    utils::Logger::log(utils::Logger::Level::INFO, "Usage:");
    utils::Logger::log(utils::Logger::Level::INFO, "  chunkio <mode> [options]");
    utils::Logger::log(utils::Logger::Level::INFO, "Modes:");
    utils::Logger::log(utils::Logger::Level::INFO, "  compress    Compress a file chunk by chunk");
    utils::Logger::log(utils::Logger::Level::INFO, "  decompress  Decompress a file chunk by chunk");
    utils::Logger::log(utils::Logger::Level::INFO, "  copy        Copy a file chunk by chunk and verify the copy");
    utils::Logger::log(utils::Logger::Level::INFO, "  digest      Print the BLAKE2b digest of a file");
    utils::Logger::log(utils::Logger::Level::INFO, "Options:");
    utils::Logger::log(utils::Logger::Level::INFO, "  -i <file>    Input file (required)");
    utils::Logger::log(utils::Logger::Level::INFO, "  -o <file>    Output file (compress defaults to input + extension)");
    utils::Logger::log(utils::Logger::Level::INFO, "  -a <algo>    gzip, deflate or bzip2 (default gzip)");
    utils::Logger::log(utils::Logger::Level::INFO, "  -l <1-9>     Compression level (default 6)");
    utils::Logger::log(utils::Logger::Level::INFO, "  -c <bytes>   Chunk size (default 8192)");
    utils::Logger::log(utils::Logger::Level::INFO, "  -r <n>       Attempts per operation (default 3)");
    utils::Logger::log(utils::Logger::Level::INFO, "  -v           Verbose output (debug logging)");
    utils::Logger::log(utils::Logger::Level::INFO, "  -h, --help   Show this help message");
    utils::Logger::log(utils::Logger::Level::INFO, "  --version    Show version information");
    utils::Logger::log(utils::Logger::Level::INFO, "Exit codes:");
    utils::Logger::log(utils::Logger::Level::INFO, "  0   Success");
    utils::Logger::log(utils::Logger::Level::INFO, "  1   Invalid usage or arguments");
    utils::Logger::log(utils::Logger::Level::INFO, "  2   Runtime error (I/O failure, corrupt input)");
    utils::Logger::log(utils::Logger::Level::INFO, "  3   Copy verification failed");
}

static void handle_basic_cases(int argc, char **argv)
{
    if (argc <= 2)
    {
        if (argc == 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help"))
        {
            usage();
            exit(SUCCESS);
        }
        if (argc == 2 && std::string(argv[1]) == "--version")
        {
            utils::Logger::log(utils::Logger::Level::INFO, std::string("chunkio version ") + VERSION);
            exit(SUCCESS);
        }
        usage();
        exit(INVALID_USAGE);
    }
}

static void handle_mode_type(const std::string &mode)
{
    const std::array<std::string, 4> modes = {"compress", "decompress", "copy", "digest"};
    if (std::find(std::begin(modes), std::end(modes), mode) == std::end(modes))
    {
        usage();
        exit(INVALID_USAGE);
    }
}

static ProgressCallback progress_printer(const std::string &label)
{
    return [label](size_t done, size_t total)
    {
        if (total > 0)
            utils::progress_bar(static_cast<int>(std::min<size_t>(99, 100 * done / total)), label, "");
    };
}

static int run_copy(const std::string &in, const std::string &out, size_t chunk_size, const ErrorHandler &errors)
{
    errors.execute_with_retry(
        [&]()
        {
            FileHandler src(in, OpenMode::read, chunk_size);
            FileHandler dst(out, OpenMode::write, chunk_size);
            const size_t total = src.size();
            size_t copied = 0;
            auto reader = src.read_chunked();
            while (auto chunk = reader.next())
            {
                const size_t n = dst.write_sync(*chunk);
                copied += n;
                if (total > 0)
                    utils::progress_bar(WriteProgress{n, copied, std::min(99.0, 100.0 * copied / total)}, "Copying:");
            }
            dst.close();
            utils::progress_bar(WriteProgress{0, copied, 100.0}, "Copying:");
        },
        "Copying " + in);

    const auto expected = file_digest(in, chunk_size);
    const auto actual = file_digest(out, chunk_size);
    if (expected != actual)
    {
        utils::Logger::log(utils::Logger::Level::ERROR, "Copy does not match source: " + to_hex(actual) + " != " + to_hex(expected));
        return VERIFY_FAILED;
    }
    utils::Logger::log(utils::Logger::Level::INFO, "Copy verified: " + to_hex(actual));
    return SUCCESS;
}

int main(int argc, char **argv)
{
    try
    {
        handle_basic_cases(argc, argv);
        std::string mode = argv[1];
        handle_mode_type(mode);

        std::string in, out;
        std::string algorithm = "gzip";
        int level = DEFAULT_COMPRESSION_LEVEL;
        size_t chunk_size = DEFAULT_CHUNK_SIZE;
        RetryConfig retry;

        for (int i = 2; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg == "-i" && i + 1 < argc)
            {
                in = argv[++i];
            }
            else if (arg == "-o" && i + 1 < argc)
            {
                out = argv[++i];
            }
            else if (arg == "-a" && i + 1 < argc)
            {
                algorithm = argv[++i];
            }
            else if (arg == "-l" && i + 1 < argc)
            {
                level = static_cast<int>(utils::parse_number("-l", argv[++i], 1, 9));
            }
            else if (arg == "-c" && i + 1 < argc)
            {
                chunk_size = static_cast<size_t>(utils::parse_number("-c", argv[++i], 1, MAX_CHUNK_SIZE));
            }
            else if (arg == "-r" && i + 1 < argc)
            {
                retry.max_attempts = static_cast<int>(utils::parse_number("-r", argv[++i], 1, MAX_ATTEMPTS));
            }
            else if (arg == "-v")
            {
                utils::Logger::set_level(utils::Logger::Level::DEBUG);
            }
            else
            {
                usage();
                return INVALID_USAGE;
            }
        }

        if (in.empty())
        {
            utils::Logger::log(utils::Logger::Level::ERROR, "Input file is required for mode " + mode);
            return INVALID_USAGE;
        }
        if (!utils::file_exists(in))
        {
            utils::Logger::log(utils::Logger::Level::ERROR, "Input file does not exist: " + in);
            return INVALID_USAGE;
        }
        if ((mode == "decompress" || mode == "copy") && out.empty())
        {
            utils::Logger::log(utils::Logger::Level::ERROR, "Output file is required for mode " + mode);
            return INVALID_USAGE;
        }

        ErrorHandler errors{RetryPolicy(retry)};

        if (mode == "compress" || mode == "decompress")
        {
            CompressionCodec codec(algorithm, level);
            if (mode == "compress")
            {
                if (out.empty())
                    out = in + codec.extension();
                size_t written = errors.execute_with_retry(
                    [&]()
                    { return compress_file(in, out, codec, chunk_size, progress_printer("Compressing:")); },
                    "Compressing " + in);
                utils::progress_bar(100, "Compressing:", "");
                utils::Logger::log(utils::Logger::Level::INFO, "Compressed to " + out + " (" + std::to_string(written) + " bytes)");
            }
            else
            {
                size_t written = errors.execute_with_retry(
                    [&]()
                    { return decompress_file(in, out, codec, chunk_size, progress_printer("Decompressing:")); },
                    "Decompressing " + in);
                utils::progress_bar(100, "Decompressing:", "");
                utils::Logger::log(utils::Logger::Level::INFO, "Decompressed to " + out + " (" + std::to_string(written) + " bytes)");
            }
            return SUCCESS;
        }

        init_crypto();

        if (mode == "copy")
            return run_copy(in, out, chunk_size, errors);

        if (mode == "digest")
        {
            std::cout << to_hex(file_digest(in, chunk_size)) << "  " << in << std::endl;
            return SUCCESS;
        }

        return SUCCESS;
    }
    catch (const ConfigError &e)
    {
        utils::Logger::log(utils::Logger::Level::ERROR, std::string(e.what()));
        return INVALID_USAGE;
    }
    catch (const std::exception &e)
    {
        ErrorHandler::log_error(e, "chunkio");
        return RUNTIME_ERROR;
    }
}

#pragma once

#include "chunkio/file_handler.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace chunkio
{
    constexpr int DEFAULT_COMPRESSION_LEVEL = 6;

    enum class Algorithm
    {
        gzip,    // RFC 1952, .gz
        deflate, // raw RFC 1951 stream, .zz
        bzip2    // .bz2
    };

    // "gzip", "deflate" or "bzip2"; anything else throws ConfigError
    Algorithm parse_algorithm(const std::string &name);
    std::string algorithm_name(Algorithm algorithm);

    // Incremental encoder or decoder for one stream. update() may buffer input
    // and return nothing; finish() flushes and ends the stream. Decoders throw
    // DecodeError on malformed input, including a stream that never terminates.
    class StreamCodec
    {
    public:
        virtual ~StreamCodec() = default;

        virtual Bytes update(const unsigned char *data, size_t length) = 0;
        virtual Bytes finish() = 0;

        Bytes update(const Bytes &data) { return update(data.data(), data.size()); }
    };

    // An algorithm and level checked once, at construction.
    class CompressionCodec
    {
    public:
        // Throws ConfigError for a level outside [1, 9]
        explicit CompressionCodec(Algorithm algorithm = Algorithm::gzip, int level = DEFAULT_COMPRESSION_LEVEL);
        // Throws ConfigError for an unknown algorithm name or a level outside [1, 9]
        explicit CompressionCodec(const std::string &algorithm, int level = DEFAULT_COMPRESSION_LEVEL);

        Bytes compress(const Bytes &data) const;
        Bytes decompress(const Bytes &data) const;

        std::unique_ptr<StreamCodec> encoder() const;
        std::unique_ptr<StreamCodec> decoder() const;

        Algorithm algorithm() const noexcept { return algorithm_; }
        int level() const noexcept { return level_; }
        std::string name() const { return algorithm_name(algorithm_); }
        std::string extension() const;

    private:
        Algorithm algorithm_;
        int level_;
    };

    // (input bytes consumed so far, input file size)
    using ProgressCallback = std::function<void(size_t, size_t)>;

    // Stream `in` through the codec into `out` one chunk at a time.
    // Both return the number of bytes written to `out`.
    size_t compress_file(const std::filesystem::path &in,
                         const std::filesystem::path &out,
                         const CompressionCodec &codec,
                         size_t chunk_size = DEFAULT_CHUNK_SIZE,
                         const ProgressCallback &on_progress = {});

    size_t decompress_file(const std::filesystem::path &in,
                           const std::filesystem::path &out,
                           const CompressionCodec &codec,
                           size_t chunk_size = DEFAULT_CHUNK_SIZE,
                           const ProgressCallback &on_progress = {});
}

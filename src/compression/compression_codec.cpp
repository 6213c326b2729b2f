#include "chunkio/compression.hpp"
#include "chunkio/errors.hpp"
#include "chunkio/utils.hpp"

#include <algorithm>
#include <new>

#include <bzlib.h>
#include <zlib.h>

namespace chunkio
{
    namespace
    {
        const size_t CHUNK = 64 * 1024;
        // zlib and libbz2 count input in unsigned int
        const size_t MAX_FEED = 1u << 30;

        const int GZIP_WINDOW_BITS = MAX_WBITS + 16;
        const int RAW_WINDOW_BITS = -MAX_WBITS;

        class ZlibEncoder : public StreamCodec
        {
        public:
            ZlibEncoder(int window_bits, int level)
            {
                if (deflateInit2(&strm_, level, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY) != Z_OK)
                    throw std::runtime_error("deflateInit2 failed");
            }
            ~ZlibEncoder() override { deflateEnd(&strm_); }

            ZlibEncoder(const ZlibEncoder &) = delete;
            ZlibEncoder &operator=(const ZlibEncoder &) = delete;

            Bytes update(const unsigned char *data, size_t length) override
            {
                Bytes out;
                while (length > 0)
                {
                    size_t feed = std::min(length, MAX_FEED);
                    strm_.next_in = const_cast<unsigned char *>(data);
                    strm_.avail_in = static_cast<uInt>(feed);
                    run(Z_NO_FLUSH, out);
                    data += feed;
                    length -= feed;
                }
                return out;
            }

            Bytes finish() override
            {
                Bytes out;
                strm_.next_in = nullptr;
                strm_.avail_in = 0;
                run(Z_FINISH, out);
                return out;
            }

        private:
            void run(int flush, Bytes &out)
            {
                unsigned char buf[CHUNK];
                int ret;
                do
                {
                    strm_.avail_out = sizeof(buf);
                    strm_.next_out = buf;
                    ret = deflate(&strm_, flush);
                    if (ret == Z_STREAM_ERROR)
                        throw std::runtime_error("deflate failed");
                    out.insert(out.end(), buf, buf + (sizeof(buf) - strm_.avail_out));
                } while (strm_.avail_out == 0 || (flush == Z_FINISH && ret != Z_STREAM_END));
            }

            z_stream strm_{};
        };

        class ZlibDecoder : public StreamCodec
        {
        public:
            explicit ZlibDecoder(int window_bits)
            {
                if (inflateInit2(&strm_, window_bits) != Z_OK)
                    throw std::runtime_error("inflateInit2 failed");
            }
            ~ZlibDecoder() override { inflateEnd(&strm_); }

            ZlibDecoder(const ZlibDecoder &) = delete;
            ZlibDecoder &operator=(const ZlibDecoder &) = delete;

            Bytes update(const unsigned char *data, size_t length) override
            {
                Bytes out;
                while (length > 0)
                {
                    if (ended_)
                        throw DecodeError("Trailing data after end of compressed stream");

                    size_t feed = std::min(length, MAX_FEED);
                    strm_.next_in = const_cast<unsigned char *>(data);
                    strm_.avail_in = static_cast<uInt>(feed);

                    unsigned char buf[CHUNK];
                    do
                    {
                        strm_.avail_out = sizeof(buf);
                        strm_.next_out = buf;
                        int ret = inflate(&strm_, Z_NO_FLUSH);
                        switch (ret)
                        {
                        case Z_NEED_DICT:
                        case Z_DATA_ERROR:
                        case Z_STREAM_ERROR:
                            throw DecodeError(std::string("Malformed compressed data: ") +
                                              (strm_.msg ? strm_.msg : "inflate failed"));
                        case Z_MEM_ERROR:
                            throw std::bad_alloc();
                        default:
                            break;
                        }
                        out.insert(out.end(), buf, buf + (sizeof(buf) - strm_.avail_out));
                        if (ret == Z_STREAM_END)
                        {
                            ended_ = true;
                            break;
                        }
                    } while (strm_.avail_out == 0);

                    if (ended_ && strm_.avail_in > 0)
                        throw DecodeError("Trailing data after end of compressed stream");
                    data += feed;
                    length -= feed;
                }
                return out;
            }

            Bytes finish() override
            {
                if (!ended_)
                    throw DecodeError("Truncated compressed stream");
                return {};
            }

        private:
            z_stream strm_{};
            bool ended_ = false;
        };

        class Bz2Encoder : public StreamCodec
        {
        public:
            explicit Bz2Encoder(int level)
            {
                // blockSize100k doubles as the level
                if (BZ2_bzCompressInit(&strm_, level, 0, 0) != BZ_OK)
                    throw std::runtime_error("BZ2_bzCompressInit failed");
            }
            ~Bz2Encoder() override { BZ2_bzCompressEnd(&strm_); }

            Bz2Encoder(const Bz2Encoder &) = delete;
            Bz2Encoder &operator=(const Bz2Encoder &) = delete;

            Bytes update(const unsigned char *data, size_t length) override
            {
                Bytes out;
                while (length > 0)
                {
                    size_t feed = std::min(length, MAX_FEED);
                    strm_.next_in = reinterpret_cast<char *>(const_cast<unsigned char *>(data));
                    strm_.avail_in = static_cast<unsigned int>(feed);

                    char buf[CHUNK];
                    do
                    {
                        strm_.avail_out = sizeof(buf);
                        strm_.next_out = buf;
                        if (BZ2_bzCompress(&strm_, BZ_RUN) != BZ_RUN_OK)
                            throw std::runtime_error("BZ2_bzCompress failed");
                        append(out, buf, sizeof(buf) - strm_.avail_out);
                    } while (strm_.avail_in > 0); // BZ_RUN with nothing to consume is a BZ_PARAM_ERROR

                    data += feed;
                    length -= feed;
                }
                return out;
            }

            Bytes finish() override
            {
                Bytes out;
                strm_.next_in = nullptr;
                strm_.avail_in = 0;
                char buf[CHUNK];
                int ret;
                do
                {
                    strm_.avail_out = sizeof(buf);
                    strm_.next_out = buf;
                    ret = BZ2_bzCompress(&strm_, BZ_FINISH);
                    if (ret != BZ_FINISH_OK && ret != BZ_STREAM_END)
                        throw std::runtime_error("BZ2_bzCompress finish failed");
                    append(out, buf, sizeof(buf) - strm_.avail_out);
                } while (ret != BZ_STREAM_END);
                return out;
            }

        private:
            static void append(Bytes &out, const char *buf, size_t n)
            {
                const auto *p = reinterpret_cast<const unsigned char *>(buf);
                out.insert(out.end(), p, p + n);
            }

            bz_stream strm_{};
        };

        class Bz2Decoder : public StreamCodec
        {
        public:
            Bz2Decoder()
            {
                if (BZ2_bzDecompressInit(&strm_, 0, 0) != BZ_OK)
                    throw std::runtime_error("BZ2_bzDecompressInit failed");
            }
            ~Bz2Decoder() override { BZ2_bzDecompressEnd(&strm_); }

            Bz2Decoder(const Bz2Decoder &) = delete;
            Bz2Decoder &operator=(const Bz2Decoder &) = delete;

            Bytes update(const unsigned char *data, size_t length) override
            {
                Bytes out;
                while (length > 0)
                {
                    if (ended_)
                        throw DecodeError("Trailing data after end of compressed stream");

                    size_t feed = std::min(length, MAX_FEED);
                    strm_.next_in = reinterpret_cast<char *>(const_cast<unsigned char *>(data));
                    strm_.avail_in = static_cast<unsigned int>(feed);

                    char buf[CHUNK];
                    do
                    {
                        strm_.avail_out = sizeof(buf);
                        strm_.next_out = buf;
                        int ret = BZ2_bzDecompress(&strm_);
                        if (ret == BZ_MEM_ERROR)
                            throw std::bad_alloc();
                        if (ret != BZ_OK && ret != BZ_STREAM_END)
                            throw DecodeError("Malformed compressed data: bzip2 error " + std::to_string(ret));
                        const auto *p = reinterpret_cast<const unsigned char *>(buf);
                        out.insert(out.end(), p, p + (sizeof(buf) - strm_.avail_out));
                        if (ret == BZ_STREAM_END)
                            ended_ = true;
                    } while (!ended_ && (strm_.avail_in > 0 || strm_.avail_out == 0));

                    if (ended_ && strm_.avail_in > 0)
                        throw DecodeError("Trailing data after end of compressed stream");
                    data += feed;
                    length -= feed;
                }
                return out;
            }

            Bytes finish() override
            {
                if (!ended_)
                    throw DecodeError("Truncated compressed stream");
                return {};
            }

        private:
            bz_stream strm_{};
            bool ended_ = false;
        };

        Bytes run_codec(StreamCodec &codec, const Bytes &data)
        {
            Bytes out = codec.update(data);
            Bytes tail = codec.finish();
            out.insert(out.end(), tail.begin(), tail.end());
            return out;
        }

        size_t pump_file(const std::filesystem::path &in,
                         const std::filesystem::path &out,
                         StreamCodec &codec,
                         size_t chunk_size,
                         const ProgressCallback &on_progress)
        {
            FileHandler src(in, OpenMode::read, chunk_size);
            FileHandler dst(out, OpenMode::write, chunk_size);

            const size_t total = src.size();
            size_t consumed = 0;
            size_t written = 0;

            auto reader = src.read_chunked();
            while (auto chunk = reader.next())
            {
                consumed += chunk->size();
                written += dst.write_sync(codec.update(*chunk));
                if (on_progress)
                    on_progress(consumed, total);
            }
            written += dst.write_sync(codec.finish());

            dst.close();
            src.close();
            return written;
        }
    }

    Algorithm parse_algorithm(const std::string &name)
    {
        if (name == "gzip")
            return Algorithm::gzip;
        if (name == "deflate")
            return Algorithm::deflate;
        if (name == "bzip2")
            return Algorithm::bzip2;
        throw ConfigError("Unsupported compression algorithm: " + name);
    }

    std::string algorithm_name(Algorithm algorithm)
    {
        switch (algorithm)
        {
        case Algorithm::gzip:
            return "gzip";
        case Algorithm::deflate:
            return "deflate";
        case Algorithm::bzip2:
            return "bzip2";
        }
        throw ConfigError("Unsupported compression algorithm");
    }

    CompressionCodec::CompressionCodec(Algorithm algorithm, int level)
        : algorithm_(algorithm), level_(level)
    {
        // rejects out-of-range enum values cast in from integers
        algorithm_name(algorithm_);
        if (level_ < 1 || level_ > 9)
            throw ConfigError("Compression level must be between 1 and 9, got " + std::to_string(level_));
    }

    CompressionCodec::CompressionCodec(const std::string &algorithm, int level)
        : CompressionCodec(parse_algorithm(algorithm), level)
    {
    }

    std::string CompressionCodec::extension() const
    {
        switch (algorithm_)
        {
        case Algorithm::gzip:
            return ".gz";
        case Algorithm::deflate:
            return ".zz";
        case Algorithm::bzip2:
            return ".bz2";
        }
        return "";
    }

    std::unique_ptr<StreamCodec> CompressionCodec::encoder() const
    {
        switch (algorithm_)
        {
        case Algorithm::gzip:
            return std::make_unique<ZlibEncoder>(GZIP_WINDOW_BITS, level_);
        case Algorithm::deflate:
            return std::make_unique<ZlibEncoder>(RAW_WINDOW_BITS, level_);
        case Algorithm::bzip2:
            return std::make_unique<Bz2Encoder>(level_);
        }
        return nullptr;
    }

    std::unique_ptr<StreamCodec> CompressionCodec::decoder() const
    {
        switch (algorithm_)
        {
        case Algorithm::gzip:
            return std::make_unique<ZlibDecoder>(GZIP_WINDOW_BITS);
        case Algorithm::deflate:
            return std::make_unique<ZlibDecoder>(RAW_WINDOW_BITS);
        case Algorithm::bzip2:
            return std::make_unique<Bz2Decoder>();
        }
        return nullptr;
    }

    Bytes CompressionCodec::compress(const Bytes &data) const
    {
        return run_codec(*encoder(), data);
    }

    Bytes CompressionCodec::decompress(const Bytes &data) const
    {
        return run_codec(*decoder(), data);
    }

    size_t compress_file(const std::filesystem::path &in,
                         const std::filesystem::path &out,
                         const CompressionCodec &codec,
                         size_t chunk_size,
                         const ProgressCallback &on_progress)
    {
        utils::Logger::log(utils::Logger::Level::DEBUG,
                           "Compressing " + in.string() + " -> " + out.string() + " (" + codec.name() +
                               ", level " + std::to_string(codec.level()) + ")");
        auto enc = codec.encoder();
        return pump_file(in, out, *enc, chunk_size, on_progress);
    }

    size_t decompress_file(const std::filesystem::path &in,
                           const std::filesystem::path &out,
                           const CompressionCodec &codec,
                           size_t chunk_size,
                           const ProgressCallback &on_progress)
    {
        utils::Logger::log(utils::Logger::Level::DEBUG,
                           "Decompressing " + in.string() + " -> " + out.string() + " (" + codec.name() + ")");
        auto dec = codec.decoder();
        return pump_file(in, out, *dec, chunk_size, on_progress);
    }
}

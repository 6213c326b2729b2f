#include "chunkio/compression.hpp"
#include "chunkio/digest.hpp"
#include "chunkio/errors.hpp"
#include "chunkio/file_handler.hpp"
#include "test_helpers.hpp"
#include <sodium.h>

using namespace chunkio;
using test::expect;

int main()
{
    init_crypto();
    test::TempDir dir("chunkio_roundtrip");

    // 300K of mixed content: text followed by random bytes
    Bytes data = test::repeat("hello chunkio\n", 10000);
    Bytes noise(160000);
    randombytes_buf(noise.data(), noise.size());
    data.insert(data.end(), noise.begin(), noise.end());

    const auto in = dir / "in.bin";
    test::write_file(in, data);
    const Digest original = file_digest(in, 4096);
    expect(original == buffer_digest(data), "chunked digest equals one-shot digest");
    expect(file_digest(in, 1) == original, "digest does not depend on chunk size");
    expect(to_hex(original).size() == 2 * crypto_generichash_BYTES, "hex digest length");

    for (const char *name : {"gzip", "deflate", "bzip2"})
    {
        CompressionCodec codec(name, 6);
        const auto packed = dir / ("in.bin" + codec.extension());
        const auto out = dir / (std::string("out_") + name + ".bin");

        size_t last_done = 0;
        size_t last_total = 0;
        size_t written = compress_file(in, packed, codec, 8192, [&](size_t done, size_t total)
                                       { last_done = done; last_total = total; });
        expect(written == std::filesystem::file_size(packed), std::string(name) + " reports bytes written");
        expect(last_done == data.size() && last_total == data.size(), std::string(name) + " progress reaches the file size");

        // the compressed file is readable by the one-shot decoder
        expect(codec.decompress(test::read_file(packed)) == data, std::string(name) + " file decodes in memory");

        decompress_file(packed, out, codec, 1000);
        expect(file_digest(out) == original, std::string(name) + " compress_file/decompress_file round trip");
    }

    // a corrupted archive surfaces as DecodeError, not as a short output
    CompressionCodec gzip("gzip");
    auto packed = dir / "corrupt.gz";
    compress_file(in, packed, gzip);
    Bytes bytes = test::read_file(packed);
    bytes.resize(bytes.size() - 8);
    test::write_file(packed, bytes);
    expect(test::throws<DecodeError>([&]
                                     { decompress_file(packed, dir / "corrupt.out", gzip); }),
           "truncated archive throws DecodeError");

    expect(test::throws<IOError>([&]
                                 { file_digest(dir / "absent.bin"); }),
           "digest of a missing file throws IOError");

    return test::finish("test_roundtrip");
}

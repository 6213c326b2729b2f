#pragma once

#include "chunkio/file_handler.hpp"

#include <array>
#include <filesystem>
#include <string>

#include <sodium.h>

namespace chunkio
{
    using Digest = std::array<unsigned char, crypto_generichash_BYTES>;

    // Initialize libsodium; throws std::runtime_error on failure. Safe to call repeatedly.
    void init_crypto();

    // BLAKE2b over the handler's contents, read through its chunked reader
    // (so its transform, if any, is applied per chunk).
    Digest digest(FileHandler &handler);
    Digest file_digest(const std::filesystem::path &path, size_t chunk_size = DEFAULT_CHUNK_SIZE);
    Digest buffer_digest(const Bytes &data);

    std::string to_hex(const Digest &digest);
}

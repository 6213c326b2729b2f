#include "chunkio/digest.hpp"
#include <stdexcept>

namespace chunkio
{
    void init_crypto()
    {
        if (sodium_init() < 0)
            throw std::runtime_error("libsodium initialization failed");
    }

    Digest digest(FileHandler &handler)
    {
        crypto_generichash_state state{};
        if (crypto_generichash_init(&state, nullptr, 0, crypto_generichash_BYTES) != 0)
            throw std::runtime_error("crypto_generichash_init failed");

        auto reader = handler.read_chunked();
        while (auto chunk = reader.next())
        {
            if (crypto_generichash_update(&state, chunk->data(), chunk->size()) != 0)
                throw std::runtime_error("crypto_generichash_update failed");
        }

        Digest out{};
        if (crypto_generichash_final(&state, out.data(), out.size()) != 0)
            throw std::runtime_error("crypto_generichash_final failed");
        return out;
    }

    Digest file_digest(const std::filesystem::path &path, size_t chunk_size)
    {
        FileHandler handler(path, OpenMode::read, chunk_size);
        Digest out = digest(handler);
        handler.close();
        return out;
    }

    Digest buffer_digest(const Bytes &data)
    {
        Digest out{};
        if (crypto_generichash(out.data(), out.size(), data.data(), data.size(), nullptr, 0) != 0)
            throw std::runtime_error("crypto_generichash failed");
        return out;
    }

    std::string to_hex(const Digest &digest)
    {
        std::string hex(digest.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
        hex.resize(digest.size() * 2);
        return hex;
    }
}

#pragma once

#include <cstddef>
#include <vector>
#include <string>
#include <filesystem>

// Thin wrappers over POSIX descriptors. Every failure throws chunkio::IOError.
namespace chunkio::io
{
    // Single read(2) of at most max_bytes; an empty result means end of file
    std::vector<unsigned char> read_chunk(int fd, size_t max_bytes);
    // Reads exactly length bytes or throws (EIO on premature end of file)
    std::vector<unsigned char> read_exact(int fd, size_t length);
    // Returns the number of bytes written, which is always length
    size_t write_all(int fd, const unsigned char *data, size_t length);
    int open_readonly(const std::filesystem::path &path);
    int open_truncate(const std::filesystem::path &path);
    void rewind(int fd);
    size_t file_size(int fd);
    void close_fd(int fd);
}

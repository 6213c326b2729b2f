#include "chunkio/file_io.hpp"
#include "chunkio/errors.hpp"
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace chunkio::io
{

    std::vector<unsigned char> read_chunk(int fd, size_t max_bytes)
    {
        std::vector<unsigned char> buf(max_bytes);
        ssize_t n;
        do
        {
            n = ::read(fd, buf.data(), buf.size());
        } while (n < 0 && errno == EINTR);
        if (n < 0)
            throw IOError(errno, "read failed");
        buf.resize(static_cast<size_t>(n));
        return buf;
    }

    std::vector<unsigned char> read_exact(int fd, size_t length)
    {
        std::vector<unsigned char> buf(length);
        size_t got = 0;
        while (got < length)
        {
            ssize_t n = ::read(fd, buf.data() + got, length - got);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                throw IOError(errno, "read failed");
            }
            if (n == 0)
                throw IOError(EIO, "short read: expected " + std::to_string(length) +
                                       " bytes, got " + std::to_string(got));
            got += static_cast<size_t>(n);
        }
        return buf;
    }

    size_t write_all(int fd, const unsigned char *data, size_t len)
    {
        size_t written = 0;
        while (written < len)
        {
            ssize_t n = ::write(fd, data + written, len - written);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                throw IOError(errno, "write failed");
            }
            if (n == 0)
                throw IOError(EIO, "short write: wrote " + std::to_string(written) +
                                       " of " + std::to_string(len) + " bytes");
            written += static_cast<size_t>(n);
        }
        return written;
    }

    int open_readonly(const std::filesystem::path &p)
    {
        int fd = ::open(p.c_str(), O_RDONLY);
        if (fd < 0)
            throw IOError(errno, "open for read failed: " + p.string());
        return fd;
    }

    int open_truncate(const std::filesystem::path &p)
    {
        int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (fd < 0)
            throw IOError(errno, "open for write failed: " + p.string());
        return fd;
    }

    void rewind(int fd)
    {
        if (::lseek(fd, 0, SEEK_SET) < 0)
            throw IOError(errno, "seek failed");
    }

    size_t file_size(int fd)
    {
        struct stat st{};
        if (::fstat(fd, &st) != 0)
            throw IOError(errno, "fstat failed");
        return static_cast<size_t>(st.st_size);
    }

    void close_fd(int fd)
    {
        // the descriptor is released even when close reports an error
        if (::close(fd) != 0 && errno != EINTR)
            throw IOError(errno, "close failed");
    }

}

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace chunkio
{
    using Bytes = std::vector<unsigned char>;

    // Applied to a whole buffer by the *_sync calls and to each slice by the
    // chunked calls. Must not touch the handler it is installed on.
    using Transform = std::function<Bytes(const Bytes &)>;

    constexpr std::size_t DEFAULT_CHUNK_SIZE = 8192;

    enum class OpenMode
    {
        read,
        write // create or truncate
    };

    struct WriteProgress
    {
        size_t bytes_written;   // bytes written by this step, after the transform
        size_t total_written;   // bytes written so far
        double percent_complete; // share of the input consumed; exactly 100 on the last step
    };

    class FileHandler;

    // Pull-based chunk sequence returned by FileHandler::read_chunked().
    // Each next() performs one read; std::nullopt means the source is exhausted.
    class ChunkReader
    {
    public:
        std::optional<Bytes> next();
        bool done() const noexcept { return done_; }

    private:
        friend class FileHandler;
        explicit ChunkReader(FileHandler &handler) : handler_(&handler) {}

        FileHandler *handler_;
        bool started_ = false;
        bool done_ = false;
    };

    // Progress sequence returned by FileHandler::write_chunked(). Each next()
    // writes one slice; std::nullopt after the final (100%) step.
    class ChunkWriter
    {
    public:
        std::optional<WriteProgress> next();
        bool done() const noexcept { return done_; }

    private:
        friend class FileHandler;
        ChunkWriter(FileHandler &handler, Bytes data)
            : handler_(&handler), data_(std::move(data)) {}

        FileHandler *handler_;
        Bytes data_;
        size_t offset_ = 0;
        size_t total_written_ = 0;
        bool done_ = false;
    };

    // Owns one file descriptor for its lifetime. Not copyable, not thread safe;
    // readers and writers it hands out must not outlive it.
    class FileHandler
    {
    public:
        explicit FileHandler(std::filesystem::path path,
                             OpenMode mode = OpenMode::read,
                             size_t chunk_size = DEFAULT_CHUNK_SIZE);
        ~FileHandler();

        FileHandler(const FileHandler &) = delete;
        FileHandler &operator=(const FileHandler &) = delete;

        // Whole file from offset 0, transformed once
        Bytes read_sync();
        // Transforms the whole input once, returns bytes written
        size_t write_sync(const Bytes &data);

        ChunkReader read_chunked();
        ChunkWriter write_chunked(Bytes data);

        // Replaces the current transform; an empty function clears it
        void set_transform(Transform fn);

        // Idempotent
        void close();

        bool is_open() const noexcept { return fd_ >= 0; }
        const std::filesystem::path &path() const noexcept { return path_; }
        OpenMode mode() const noexcept { return mode_; }
        size_t chunk_size() const noexcept { return chunk_size_; }
        size_t size() const;

    private:
        friend class ChunkReader;
        friend class ChunkWriter;

        int checked_fd() const;
        // checked_fd() that also fails with EBADF when the handle was opened
        // in the other direction, even if the call would not touch the file
        int checked_fd(OpenMode needed) const;
        Bytes apply_transform(Bytes data) const;

        std::filesystem::path path_;
        OpenMode mode_;
        size_t chunk_size_;
        int fd_ = -1;
        Transform transform_;
    };
}

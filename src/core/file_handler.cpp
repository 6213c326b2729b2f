#include "chunkio/file_handler.hpp"
#include "chunkio/errors.hpp"
#include "chunkio/file_io.hpp"
#include "chunkio/utils.hpp"
#include <algorithm>
#include <cerrno>

namespace chunkio
{
    FileHandler::FileHandler(std::filesystem::path path, OpenMode mode, size_t chunk_size)
        : path_(std::move(path)), mode_(mode), chunk_size_(chunk_size)
    {
        if (chunk_size_ == 0)
            throw ConfigError("Chunk size must be greater than zero");

        fd_ = mode_ == OpenMode::read ? io::open_readonly(path_) : io::open_truncate(path_);

        utils::Logger::log(utils::Logger::Level::DEBUG,
                           "Opened " + path_.string() + (mode_ == OpenMode::read ? " for read" : " for write") +
                               " (chunk size " + std::to_string(chunk_size_) + ")");
    }

    FileHandler::~FileHandler()
    {
        try
        {
            close();
        }
        catch (const IOError &e)
        {
            utils::Logger::log(utils::Logger::Level::WARNING,
                               "Closing " + path_.string() + " failed: " + e.what());
        }
    }

    void FileHandler::close()
    {
        if (fd_ < 0)
            return;
        int fd = fd_;
        fd_ = -1;
        io::close_fd(fd);
        utils::Logger::log(utils::Logger::Level::DEBUG, "Closed " + path_.string());
    }

    int FileHandler::checked_fd() const
    {
        if (fd_ < 0)
            throw IOError(EBADF, "file handle is closed: " + path_.string());
        return fd_;
    }

    int FileHandler::checked_fd(OpenMode needed) const
    {
        int fd = checked_fd();
        if (mode_ != needed)
            throw IOError(EBADF, std::string("file handle is not open for ") +
                                     (needed == OpenMode::read ? "reading: " : "writing: ") + path_.string());
        return fd;
    }

    size_t FileHandler::size() const
    {
        return io::file_size(checked_fd());
    }

    void FileHandler::set_transform(Transform fn)
    {
        transform_ = std::move(fn);
    }

    Bytes FileHandler::apply_transform(Bytes data) const
    {
        if (!transform_)
            return data;
        return transform_(data);
    }

    Bytes FileHandler::read_sync()
    {
        int fd = checked_fd(OpenMode::read);
        io::rewind(fd);
        return apply_transform(io::read_exact(fd, io::file_size(fd)));
    }

    size_t FileHandler::write_sync(const Bytes &data)
    {
        int fd = checked_fd(OpenMode::write);
        Bytes out = apply_transform(data);
        return io::write_all(fd, out.data(), out.size());
    }

    ChunkReader FileHandler::read_chunked()
    {
        checked_fd(OpenMode::read);
        return ChunkReader(*this);
    }

    ChunkWriter FileHandler::write_chunked(Bytes data)
    {
        checked_fd(OpenMode::write);
        return ChunkWriter(*this, std::move(data));
    }

    std::optional<Bytes> ChunkReader::next()
    {
        if (done_)
            return std::nullopt;

        int fd = handler_->checked_fd(OpenMode::read);
        if (!started_)
        {
            io::rewind(fd);
            started_ = true;
        }

        while (true)
        {
            Bytes raw = io::read_chunk(fd, handler_->chunk_size_);
            if (raw.empty())
            {
                done_ = true;
                return std::nullopt;
            }
            // a transform may drop a whole chunk; keep reading until it yields bytes
            Bytes chunk = handler_->apply_transform(std::move(raw));
            if (!chunk.empty())
                return chunk;
        }
    }

    std::optional<WriteProgress> ChunkWriter::next()
    {
        if (done_)
            return std::nullopt;

        int fd = handler_->checked_fd();
        const size_t total = data_.size();

        if (total == 0)
        {
            done_ = true;
            return WriteProgress{0, 0, 100.0};
        }

        const size_t len = std::min(handler_->chunk_size_, total - offset_);
        Bytes slice(data_.begin() + static_cast<std::ptrdiff_t>(offset_),
                    data_.begin() + static_cast<std::ptrdiff_t>(offset_ + len));
        slice = handler_->apply_transform(std::move(slice));

        size_t written = io::write_all(fd, slice.data(), slice.size());
        total_written_ += written;
        offset_ += len;

        WriteProgress progress{written, total_written_, 100.0 * static_cast<double>(offset_) / static_cast<double>(total)};
        if (offset_ >= total)
        {
            progress.percent_complete = 100.0;
            done_ = true;
            // the input buffer can be large; it is no longer needed
            Bytes().swap(data_);
        }
        return progress;
    }
}

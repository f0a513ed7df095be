#include <algorithm>
#include <cstring>
#include <mutex>
#include <new>
#include <stdexcept>

#include <fmt/format.h>

#include <rangeloader/sink.hpp>

namespace rangeloader
{
    namespace
    {
        DownloadError sink_error(std::int64_t offset, std::size_t size, const std::string& what)
        {
            return DownloadError{ ErrorLevel::FATAL,
                                  ErrorCode::RL_SINK_WRITE,
                                  fmt::format("failed to write {} byte(s) at offset {}: {}",
                                              size,
                                              offset,
                                              what) };
        }
    }

    /**************
     * MemorySink *
     **************/

    MemorySink::MemorySink(std::vector<char> buffer)
        : m_data(std::move(buffer))
    {
        m_data.clear();
    }

    tl::expected<void, DownloadError> MemorySink::write(const char* data, std::size_t size)
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        const auto offset = static_cast<std::int64_t>(m_data.size());
        try
        {
            m_data.insert(m_data.end(), data, data + size);
        }
        catch (const std::bad_alloc& e)
        {
            return tl::unexpected(sink_error(offset, size, e.what()));
        }
        catch (const std::length_error& e)
        {
            return tl::unexpected(sink_error(offset, size, e.what()));
        }
        return {};
    }

    tl::expected<void, DownloadError> MemorySink::write_at(std::int64_t offset,
                                                           const char* data,
                                                           std::size_t size)
    {
        if (offset < 0)
        {
            return tl::unexpected(sink_error(offset, size, "negative offset"));
        }
        if (size == 0)
            return {};

        const std::size_t begin = static_cast<std::size_t>(offset);
        const std::size_t end = begin + size;

        {
            // in-bound writes to disjoint regions only need to keep the buffer from moving
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            if (end <= m_data.size())
            {
                std::memcpy(m_data.data() + begin, data, size);
                return {};
            }
        }

        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (m_data.size() < end)
        {
            try
            {
                m_data.resize(end, '\0');
            }
            catch (const std::bad_alloc& e)
            {
                return tl::unexpected(sink_error(offset, size, e.what()));
            }
            catch (const std::length_error& e)
            {
                return tl::unexpected(sink_error(offset, size, e.what()));
            }
        }
        std::memcpy(m_data.data() + begin, data, size);
        return {};
    }

    tl::expected<void, DownloadError> MemorySink::reserve(std::size_t capacity)
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        try
        {
            m_data.reserve(capacity);
        }
        catch (const std::bad_alloc& e)
        {
            return tl::unexpected(sink_error(0, capacity, e.what()));
        }
        catch (const std::length_error& e)
        {
            return tl::unexpected(sink_error(0, capacity, e.what()));
        }
        return {};
    }

    std::size_t MemorySink::size() const
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_data.size();
    }

    std::vector<char> MemorySink::release()
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        std::vector<char> result;
        result.swap(m_data);
        return result;
    }

    /************
     * FileSink *
     ************/

    FileSink::FileSink(std::unique_ptr<FileIO> file)
        : m_file(std::move(file))
    {
    }

    tl::expected<std::unique_ptr<FileSink>, DownloadError> FileSink::create(const fs::path& path,
                                                                          std::int64_t length)
    {
        std::error_code ec;
        auto file = std::make_unique<FileIO>(path, FileIO::write_update_binary, ec);
        if (ec)
        {
            return tl::unexpected(
                DownloadError{ ErrorLevel::FATAL,
                               ErrorCode::RL_FILE_CREATE,
                               fmt::format("failed to open dest file {}: {}",
                                           path.string(),
                                           ec.message()) });
        }

        file->truncate(std::max<std::int64_t>(length, 0), ec);
        if (ec)
        {
            return tl::unexpected(
                DownloadError{ ErrorLevel::FATAL,
                               ErrorCode::RL_FILE_TRUNCATE,
                               fmt::format("failed to truncate file to {} byte(s): {}",
                                           length,
                                           ec.message()) });
        }

        spdlog::debug("Created {} with {} byte(s)", path.string(), length);
        return std::unique_ptr<FileSink>(new FileSink(std::move(file)));
    }

    tl::expected<void, DownloadError> FileSink::write(const char* data, std::size_t size)
    {
        auto res = write_at(m_append_offset, data, size);
        if (res)
        {
            m_append_offset += static_cast<std::int64_t>(size);
        }
        return res;
    }

    tl::expected<void, DownloadError> FileSink::write_at(std::int64_t offset,
                                                         const char* data,
                                                         std::size_t size)
    {
        if (!m_file->open())
        {
            return tl::unexpected(sink_error(offset, size, "file is closed"));
        }
        if (offset < 0)
        {
            return tl::unexpected(sink_error(offset, size, "negative offset"));
        }

        std::error_code ec;
        m_file->write_at(offset, data, size, ec);
        if (ec)
        {
            return tl::unexpected(sink_error(offset, size, ec.message()));
        }
        return {};
    }

    tl::expected<void, DownloadError> FileSink::close()
    {
        std::error_code ec;
        m_file->close(ec);
        if (ec)
        {
            return tl::unexpected(
                DownloadError{ ErrorLevel::FATAL,
                               ErrorCode::RL_SINK_WRITE,
                               fmt::format("could not close file {}: {}",
                                           m_file->path().string(),
                                           ec.message()) });
        }
        return {};
    }

    /****************
     * OffsetWriter *
     ****************/

    OffsetWriter::OffsetWriter(Sink& sink, std::int64_t offset, std::optional<std::int64_t> limit)
        : m_sink(sink)
        , m_offset(offset)
        , m_limit(limit)
    {
    }

    tl::expected<void, DownloadError> OffsetWriter::write(const char* data, std::size_t size)
    {
        const auto incoming = static_cast<std::int64_t>(size);
        if (m_limit && m_written + incoming > m_limit.value())
        {
            return tl::unexpected(DownloadError{
                ErrorLevel::SERIOUS,
                ErrorCode::RL_RANGE_MISMATCH,
                fmt::format("received more than the {} byte(s) expected at offset {}",
                            m_limit.value(),
                            m_offset) });
        }

        auto res = m_sink.write_at(m_offset + m_written, data, size);
        if (res)
        {
            m_written += incoming;
        }
        return res;
    }
}

#ifndef RANGELOADER_SINK_HPP
#define RANGELOADER_SINK_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

#include <tl/expected.hpp>

#include <rangeloader/export.hpp>
#include <rangeloader/errors.hpp>
#include <rangeloader/fileio.hpp>

namespace rangeloader
{
    // Sequential write target.
    class RANGELOADER_API Writer
    {
    public:
        virtual ~Writer() = default;

        virtual tl::expected<void, DownloadError> write(const char* data, std::size_t size) = 0;
    };

    // Destination of downloaded bytes, written either sequentially or at explicit offsets.
    //
    // `write_at` calls targeting disjoint offsets may come concurrently from several workers
    // and each implementation is responsible for keeping its storage consistent under them.
    // `write` calls must not race with each other.
    class RANGELOADER_API Sink : public Writer
    {
    public:
        virtual tl::expected<void, DownloadError> write_at(std::int64_t offset,
                                                           const char* data,
                                                           std::size_t size)
            = 0;
    };

    class RANGELOADER_API MemorySink : public Sink
    {
    public:
        MemorySink() = default;

        // Adopts the storage of `buffer`: its contents are dropped, its capacity is reused.
        explicit MemorySink(std::vector<char> buffer);

        MemorySink(const MemorySink&) = delete;
        MemorySink& operator=(const MemorySink&) = delete;

        tl::expected<void, DownloadError> write(const char* data, std::size_t size) override;

        // Grows the buffer to at least `offset + size`, zero-filling any gap.
        // Running out of memory is reported as RL_SINK_WRITE.
        tl::expected<void, DownloadError> write_at(std::int64_t offset,
                                                   const char* data,
                                                   std::size_t size) override;

        tl::expected<void, DownloadError> reserve(std::size_t capacity);

        std::size_t size() const;

        // Not synchronized: only valid once all writers are done.
        const std::vector<char>& data() const noexcept
        {
            return m_data;
        }

        std::vector<char> release();

    private:
        mutable std::shared_mutex m_mutex;
        std::vector<char> m_data;
    };

    class RANGELOADER_API FileSink : public Sink
    {
    public:
        // Creates (or truncates) `path` and sizes it to `length` bytes up-front so that
        // positional writes never need to extend it.
        static tl::expected<std::unique_ptr<FileSink>, DownloadError> create(
            const fs::path& path, std::int64_t length);

        tl::expected<void, DownloadError> write(const char* data, std::size_t size) override;

        tl::expected<void, DownloadError> write_at(std::int64_t offset,
                                                   const char* data,
                                                   std::size_t size) override;

        tl::expected<void, DownloadError> close();

        const fs::path& path() const noexcept
        {
            return m_file->path();
        }

    private:
        explicit FileSink(std::unique_ptr<FileIO> file);

        std::unique_ptr<FileIO> m_file;
        std::int64_t m_append_offset = 0;
    };

    // Drives a `Sink` through the sequential interface, starting at a fixed offset and
    // advancing by what was written. With a limit set, writing past it fails.
    class RANGELOADER_API OffsetWriter : public Writer
    {
    public:
        OffsetWriter(Sink& sink,
                     std::int64_t offset,
                     std::optional<std::int64_t> limit = std::nullopt);

        tl::expected<void, DownloadError> write(const char* data, std::size_t size) override;

        std::int64_t offset() const noexcept
        {
            return m_offset;
        }

        std::int64_t written() const noexcept
        {
            return m_written;
        }

    private:
        Sink& m_sink;
        std::int64_t m_offset;
        std::optional<std::int64_t> m_limit;
        std::int64_t m_written = 0;
    };
}

#endif

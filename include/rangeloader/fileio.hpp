#ifndef RANGELOADER_FILEIO_HPP
#define RANGELOADER_FILEIO_HPP

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <system_error>

#include <spdlog/spdlog.h>

#ifndef _WIN32
#include <unistd.h>
#include <sys/types.h>
#else
#include <windows.h>
#endif


namespace rangeloader
{
    namespace fs = std::filesystem;

    class FileIO
    {
    private:
        FILE* m_fs = nullptr;
        fs::path m_path;
#ifdef _WIN32
        // positional writes are emulated with seek + write
        std::mutex m_positional_mutex;
#endif

    public:
#ifdef _WIN32
        constexpr static wchar_t read_update_binary[] = L"rb+";
        constexpr static wchar_t write_update_binary[] = L"wb+";
        constexpr static wchar_t read_binary[] = L"rb";
#else
        constexpr static char read_update_binary[] = "rb+";
        constexpr static char write_update_binary[] = "wb+";
        constexpr static char read_binary[] = "rb";
#endif

        FileIO() = default;
        FileIO(const FileIO&) = delete;
        FileIO& operator=(const FileIO&) = delete;

#ifdef _WIN32
        inline explicit FileIO(const fs::path& file_path,
                               const wchar_t* mode,
                               std::error_code& ec) noexcept
            : m_path(file_path)
        {
            m_fs = ::_wfsopen(file_path.wstring().c_str(), mode, _SH_DENYNO);
            if (!m_fs)
            {
                ec.assign(GetLastError(), std::generic_category());
                spdlog::error("Could not open file: {}", ec.message());
            }
        }
#else
        inline explicit FileIO(const fs::path& file_path,
                               const char* mode,
                               std::error_code& ec) noexcept
            : m_path(file_path)
        {
            m_fs = ::fopen(file_path.c_str(), mode);
            if (m_fs)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
                spdlog::error("Could not open file: {}", ec.message());
            }
        }
#endif

        inline ~FileIO()
        {
            if (m_fs)
            {
                std::error_code ec;
                close(ec);
                if (ec)
                {
                    spdlog::error("Error: {}", ec.message());
                }
            }
        }

        inline int fd() const noexcept
        {
#ifndef _WIN32
            return ::fileno(m_fs);
#else
            return ::_fileno(m_fs);
#endif
        }

        inline int seek(long long offset, int origin) const noexcept
        {
#ifdef _WIN32
            return ::_fseeki64(m_fs, offset, origin);
#else
            return ::fseeko(m_fs, static_cast<off_t>(offset), origin);
#endif
        }

        inline bool open() const noexcept
        {
            return m_fs != nullptr;
        }

        inline long long tell() const
        {
#ifdef _WIN32
            return ::_ftelli64(m_fs);
#else
            return ::ftello(m_fs);
#endif
        }

        inline std::size_t read(void* buffer,
                                std::size_t element_size,
                                std::size_t element_count) const noexcept
        {
            return ::fread(buffer, element_size, element_count, m_fs);
        }

        inline std::size_t write(const void* buffer,
                                 std::size_t element_size,
                                 std::size_t element_count) const noexcept
        {
            return ::fwrite(buffer, element_size, element_count, m_fs);
        }

        // Writes `size` bytes at `offset` without moving the stream position.
        // Calls for disjoint offsets may run concurrently.
        void write_at(long long offset,
                      const char* buffer,
                      std::size_t size,
                      std::error_code& ec) noexcept
        {
            ec.clear();
#ifndef _WIN32
            while (size > 0)
            {
                ssize_t n = ::pwrite(fd(), buffer, size, static_cast<off_t>(offset));
                if (n < 0)
                {
                    if (errno == EINTR)
                        continue;
                    ec.assign(errno, std::generic_category());
                    return;
                }
                buffer += n;
                offset += n;
                size -= static_cast<std::size_t>(n);
            }
#else
            std::lock_guard<std::mutex> lock(m_positional_mutex);
            if (seek(offset, SEEK_SET) != 0 || write(buffer, 1, size) != size)
            {
                ec.assign(errno, std::generic_category());
            }
#endif
        }

        void truncate(long long length, std::error_code& ec) const noexcept
        {
#ifdef _WIN32
            return fs::resize_file(m_path, length, ec);
#else
            ec.clear();
            if (::ftruncate(fd(), static_cast<off_t>(length)) != 0)
            {
                ec.assign(errno, std::generic_category());
            }
#endif
        }

        inline const fs::path& path() const
        {
            return m_path;
        }

        void close(std::error_code& ec) noexcept
        {
            if (!m_fs)
            {
                ec.clear();
                return;
            }
            if (::fclose(m_fs) == 0)
            {
                ec.clear();
                m_fs = nullptr;
            }
            else
            {
                ec.assign(errno, std::generic_category());
                m_fs = nullptr;
            }
        }

        inline int error()
        {
            return ::ferror(m_fs);
        }
    };
}

#endif

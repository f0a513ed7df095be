#ifndef RANGELOADER_BYTE_RANGE_HPP
#define RANGELOADER_BYTE_RANGE_HPP

#include <cstdint>
#include <optional>
#include <string>

#include <rangeloader/export.hpp>

namespace rangeloader
{
    // An inclusive byte range [start, end], as carried by a `Range: bytes=start-end` header.
    struct RANGELOADER_API ByteRange
    {
        std::int64_t start = 0;
        std::int64_t end = 0;

        std::int64_t size() const noexcept
        {
            return end - start + 1;
        }

        // "start-end", the value curl expects for CURLOPT_RANGE.
        std::string to_header() const;

        bool operator==(const ByteRange& other) const noexcept
        {
            return start == other.start && end == other.end;
        }

        bool operator!=(const ByteRange& other) const noexcept
        {
            return !(*this == other);
        }
    };

    // Lazily partitions [0, length) into consecutive ranges of `chunk_size` bytes.
    // The last range is shorter when `length` is not a multiple of `chunk_size`.
    class RANGELOADER_API RangeSequence
    {
    public:
        RangeSequence(std::int64_t length, std::int64_t chunk_size);

        std::optional<ByteRange> next();

        std::int64_t count() const noexcept;

        std::int64_t length() const noexcept
        {
            return m_length;
        }

    private:
        std::int64_t m_length;
        std::int64_t m_chunk_size;
        std::int64_t m_offset = 0;
    };
}

#endif

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

#include <rangeloader/byte_range.hpp>

namespace rangeloader
{
    std::string ByteRange::to_header() const
    {
        return fmt::format("{}-{}", start, end);
    }

    RangeSequence::RangeSequence(std::int64_t length, std::int64_t chunk_size)
        : m_length(std::max<std::int64_t>(length, 0))
        , m_chunk_size(chunk_size)
    {
        if (chunk_size <= 0)
            throw std::invalid_argument("chunk size must be positive");
    }

    std::optional<ByteRange> RangeSequence::next()
    {
        if (m_offset >= m_length)
            return std::nullopt;

        ByteRange r;
        r.start = m_offset;
        // clamp before adding to stay clear of overflow with huge chunk sizes
        r.end = (m_length - m_offset > m_chunk_size) ? m_offset + m_chunk_size - 1
                                                     : m_length - 1;
        m_offset = r.end + 1;
        return r;
    }

    std::int64_t RangeSequence::count() const noexcept
    {
        return m_length / m_chunk_size + (m_length % m_chunk_size != 0 ? 1 : 0);
    }
}

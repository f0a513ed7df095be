#include <doctest/doctest.h>

#include <stdexcept>
#include <vector>

#include <rangeloader/byte_range.hpp>

using namespace rangeloader;

namespace
{
    std::vector<ByteRange> collect(RangeSequence seq)
    {
        std::vector<ByteRange> result;
        while (auto r = seq.next())
        {
            result.push_back(r.value());
        }
        return result;
    }
}

TEST_SUITE("byte_range")
{
    TEST_CASE("size_and_header")
    {
        ByteRange r{ 10, 19 };
        CHECK_EQ(r.size(), 10);
        CHECK_EQ(r.to_header(), "10-19");

        ByteRange single{ 0, 0 };
        CHECK_EQ(single.size(), 1);
        CHECK_EQ(single.to_header(), "0-0");
    }

    TEST_CASE("partition_with_remainder")
    {
        const std::int64_t mib = 1024 * 1024;
        auto ranges = collect(RangeSequence(25 * mib, 10 * mib));

        REQUIRE_EQ(ranges.size(), 3);
        CHECK_EQ(ranges[0], ByteRange{ 0, 10 * mib - 1 });
        CHECK_EQ(ranges[1], ByteRange{ 10 * mib, 20 * mib - 1 });
        CHECK_EQ(ranges[2], ByteRange{ 20 * mib, 25 * mib - 1 });
        CHECK_EQ(RangeSequence(25 * mib, 10 * mib).count(), 3);
    }

    TEST_CASE("partition_decimal_sizes")
    {
        auto ranges = collect(RangeSequence(25000000, 10000000));

        REQUIRE_EQ(ranges.size(), 3);
        CHECK_EQ(ranges[0].to_header(), "0-9999999");
        CHECK_EQ(ranges[1].to_header(), "10000000-19999999");
        CHECK_EQ(ranges[2].to_header(), "20000000-24999999");
    }

    TEST_CASE("ranges_are_contiguous")
    {
        for (std::int64_t length : { 1, 7, 100, 1000, 4097 })
        {
            for (std::int64_t chunk : { 1, 3, 64, 1000, 5000 })
            {
                auto ranges = collect(RangeSequence(length, chunk));
                REQUIRE_FALSE(ranges.empty());
                CHECK_EQ(ranges.front().start, 0);
                CHECK_EQ(ranges.back().end, length - 1);
                CHECK_EQ(static_cast<std::int64_t>(ranges.size()),
                         RangeSequence(length, chunk).count());

                std::int64_t total = 0;
                for (std::size_t i = 0; i < ranges.size(); ++i)
                {
                    CHECK_LE(ranges[i].size(), chunk);
                    if (i > 0)
                    {
                        CHECK_EQ(ranges[i].start, ranges[i - 1].end + 1);
                    }
                    total += ranges[i].size();
                }
                CHECK_EQ(total, length);
            }
        }
    }

    TEST_CASE("chunk_larger_than_length")
    {
        auto ranges = collect(RangeSequence(5, 10));
        REQUIRE_EQ(ranges.size(), 1);
        CHECK_EQ(ranges[0], ByteRange{ 0, 4 });
    }

    TEST_CASE("one_byte_chunks")
    {
        auto ranges = collect(RangeSequence(1024 * 1024, 1));
        CHECK_EQ(ranges.size(), 1024 * 1024);
        CHECK_EQ(ranges.back(), ByteRange{ 1024 * 1024 - 1, 1024 * 1024 - 1 });
    }

    TEST_CASE("empty_length")
    {
        RangeSequence seq(0, 10);
        CHECK_FALSE(seq.next().has_value());
        CHECK_EQ(seq.count(), 0);
    }

    TEST_CASE("invalid_chunk_size")
    {
        CHECK_THROWS_AS(RangeSequence(10, 0), std::invalid_argument);
        CHECK_THROWS_AS(RangeSequence(10, -5), std::invalid_argument);
    }
}

#include <doctest/doctest.h>

#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <rangeloader/sink.hpp>

using namespace rangeloader;

namespace
{
    std::string read_file(const fs::path& path)
    {
        std::ifstream f(path, std::ios::binary);
        std::stringstream buffer;
        buffer << f.rdbuf();
        return buffer.str();
    }

    std::string as_string(const std::vector<char>& data)
    {
        return std::string(data.begin(), data.end());
    }
}

TEST_SUITE("sink")
{
    TEST_CASE("memory_sequential")
    {
        MemorySink sink;
        REQUIRE(sink.write("hello ", 6));
        REQUIRE(sink.write("world", 5));
        CHECK_EQ(as_string(sink.data()), "hello world");
    }

    TEST_CASE("memory_write_at_fills_gaps")
    {
        MemorySink sink;
        REQUIRE(sink.write_at(4, "cd", 2));
        CHECK_EQ(sink.size(), 6);
        CHECK_EQ(as_string(sink.data()), std::string("\0\0\0\0cd", 6));

        REQUIRE(sink.write_at(0, "ab", 2));
        CHECK_EQ(as_string(sink.data()), std::string("ab\0\0cd", 6));
    }

    TEST_CASE("memory_negative_offset")
    {
        MemorySink sink;
        auto res = sink.write_at(-1, "x", 1);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::RL_SINK_WRITE);
    }

    TEST_CASE("memory_out_of_memory")
    {
        MemorySink sink;
        REQUIRE(sink.write("abc", 3));

        auto far = sink.write_at(std::int64_t(1) << 49, "x", 1);
        REQUIRE_FALSE(far);
        CHECK_EQ(far.error().code, ErrorCode::RL_SINK_WRITE);
        CHECK_EQ(sink.size(), 3);

        auto reserved = sink.reserve(std::size_t(1) << 50);
        REQUIRE_FALSE(reserved);
        CHECK_EQ(reserved.error().code, ErrorCode::RL_SINK_WRITE);
        CHECK_EQ(as_string(sink.data()), "abc");
    }

    TEST_CASE("memory_adopts_buffer")
    {
        std::vector<char> existing(64, 'z');
        const auto capacity = existing.capacity();
        MemorySink sink(std::move(existing));
        CHECK_EQ(sink.size(), 0);

        REQUIRE(sink.write("abc", 3));
        auto released = sink.release();
        CHECK_EQ(as_string(released), "abc");
        CHECK_GE(released.capacity(), capacity);
        CHECK_EQ(sink.size(), 0);
    }

    TEST_CASE("memory_concurrent_write_at")
    {
        constexpr int workers = 8;
        constexpr int block = 4096;

        MemorySink sink;
        std::vector<std::thread> threads;
        for (int i = 0; i < workers; ++i)
        {
            threads.emplace_back(
                [&sink, i]
                {
                    std::string data(block, static_cast<char>('a' + i));
                    auto res = sink.write_at(static_cast<std::int64_t>(i) * block,
                                             data.data(),
                                             data.size());
                    CHECK(res);
                });
        }
        for (auto& t : threads)
        {
            t.join();
        }

        REQUIRE_EQ(sink.size(), workers * block);
        for (int i = 0; i < workers; ++i)
        {
            CHECK_EQ(sink.data()[i * block], static_cast<char>('a' + i));
            CHECK_EQ(sink.data()[(i + 1) * block - 1], static_cast<char>('a' + i));
        }
    }

    TEST_CASE("file_create_sizes_file")
    {
        const fs::path path = "sink_sized.bin";
        auto sink = FileSink::create(path, 10);
        REQUIRE(sink);
        CHECK_EQ(fs::file_size(path), 10);

        REQUIRE(sink.value()->write_at(5, "world", 5));
        REQUIRE(sink.value()->write_at(0, "hello", 5));
        REQUIRE(sink.value()->close());
        CHECK_EQ(read_file(path), "helloworld");
        fs::remove(path);
    }

    TEST_CASE("file_create_truncates_existing")
    {
        const fs::path path = "sink_truncated.bin";
        {
            std::ofstream f(path);
            f << "some much longer previous content";
        }
        auto sink = FileSink::create(path, 0);
        REQUIRE(sink);
        REQUIRE(sink.value()->write("new", 3));
        REQUIRE(sink.value()->write(" data", 5));
        REQUIRE(sink.value()->close());
        CHECK_EQ(read_file(path), "new data");
        fs::remove(path);
    }

    TEST_CASE("file_create_in_missing_directory")
    {
        auto sink = FileSink::create("does/not/exist/file.bin", 10);
        REQUIRE_FALSE(sink);
        CHECK_EQ(sink.error().code, ErrorCode::RL_FILE_CREATE);
    }

    TEST_CASE("file_write_after_close")
    {
        const fs::path path = "sink_closed.bin";
        auto sink = FileSink::create(path, 0);
        REQUIRE(sink);
        REQUIRE(sink.value()->close());
        auto res = sink.value()->write("x", 1);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::RL_SINK_WRITE);
        fs::remove(path);
    }

    TEST_CASE("offset_writer")
    {
        MemorySink sink;
        OffsetWriter writer(sink, 3);
        REQUIRE(writer.write("ab", 2));
        REQUIRE(writer.write("cd", 2));
        CHECK_EQ(writer.offset(), 3);
        CHECK_EQ(writer.written(), 4);
        CHECK_EQ(as_string(sink.data()), std::string("\0\0\0abcd", 7));
    }

    TEST_CASE("offset_writer_limit")
    {
        MemorySink sink;
        OffsetWriter writer(sink, 0, 4);
        REQUIRE(writer.write("abc", 3));

        auto res = writer.write("de", 2);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::RL_RANGE_MISMATCH);
        CHECK_EQ(writer.written(), 3);
        CHECK_EQ(sink.size(), 3);
    }
}

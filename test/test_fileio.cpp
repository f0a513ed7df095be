#include <doctest/doctest.h>
#include <fstream>
#include <sstream>
#include <rangeloader/fileio.hpp>

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
}

TEST_SUITE("fileio")
{
    TEST_CASE("open")
    {
        std::error_code ec;
        FileIO f("test.txt", FileIO::write_update_binary, ec);

        CHECK_FALSE(ec);
        CHECK(f.open());
        f.write("test", 1, 4);
        f.close(ec);
        CHECK_FALSE(ec);
        CHECK_FALSE(f.open());
        CHECK_EQ(read_file("test.txt"), "test");
    }

    TEST_CASE("open_missing")
    {
        std::error_code ec;
        FileIO f("missing/dir/test.txt", FileIO::read_binary, ec);
        CHECK(ec);
        CHECK_FALSE(f.open());
    }

    TEST_CASE("truncate_empty")
    {
        std::error_code ec;
        FileIO f("empty.txt", FileIO::write_update_binary, ec);
        CHECK_FALSE(ec);
        CHECK(fs::exists("empty.txt"));
        f.truncate(0, ec);
        CHECK_FALSE(ec);
        CHECK_EQ(fs::file_size("empty.txt"), 0);
    }

    TEST_CASE("truncate_grows_with_zeros")
    {
        std::error_code ec;
        {
            FileIO f("grown.bin", FileIO::write_update_binary, ec);
            REQUIRE_FALSE(ec);
            f.truncate(8, ec);
            CHECK_FALSE(ec);
        }
        CHECK_EQ(read_file("grown.bin"), std::string(8, '\0'));
    }

    TEST_CASE("write_at")
    {
        std::error_code ec;
        {
            FileIO f("positional.bin", FileIO::write_update_binary, ec);
            REQUIRE_FALSE(ec);
            f.write_at(6, "world", 5, ec);
            CHECK_FALSE(ec);
            f.write_at(0, "hello ", 6, ec);
            CHECK_FALSE(ec);

            // the stream position is left alone
            CHECK_EQ(f.tell(), 0);
        }
        CHECK_EQ(read_file("positional.bin"), "hello world");
    }

    TEST_CASE("seek_and_read")
    {
        {
            std::ofstream out("readable.txt");
            out << "Hello world this is file number 1";
        }
        std::error_code ec;
        FileIO f("readable.txt", FileIO::read_binary, ec);
        REQUIRE_FALSE(ec);

        f.seek(0, SEEK_END);
        CHECK_EQ(f.tell(), 33);

        char buffer[5] = {};
        f.seek(6, SEEK_SET);
        CHECK_EQ(f.read(buffer, 1, 5), 5);
        CHECK_EQ(std::string(buffer, 5), "world");
    }
}

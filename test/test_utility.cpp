#include <doctest/doctest.h>

#include <fstream>

#include <rangeloader/utils.hpp>

using namespace rangeloader;

TEST_SUITE("utility")
{
    TEST_CASE("parse_header")
    {
        auto [key, value] = parse_header("Content-Length: 1234\r\n");
        CHECK_EQ(key, "content-length");
        CHECK_EQ(value, "1234");

        auto [rkey, rvalue] = parse_header("Location:   https://example.com/a:b  \r\n");
        CHECK_EQ(rkey, "location");
        CHECK_EQ(rvalue, "https://example.com/a:b");

        auto [skey, svalue] = parse_header("HTTP/1.1 200 OK\r\n");
        CHECK(skey.empty());
    }

    TEST_CASE("parse_size")
    {
        CHECK_EQ(parse_size("1048576").value(), 1048576);
        CHECK_EQ(parse_size("512K").value(), 512 * 1024);
        CHECK_EQ(parse_size("10M").value(), 10 * 1024 * 1024);
        CHECK_EQ(parse_size("10m").value(), 10 * 1024 * 1024);
        CHECK_EQ(parse_size("2G").value(), std::int64_t(2) * 1024 * 1024 * 1024);

        CHECK_FALSE(parse_size("").has_value());
        CHECK_FALSE(parse_size("M").has_value());
        CHECK_FALSE(parse_size("-1").has_value());
        CHECK_FALSE(parse_size("12 MB").has_value());
        CHECK_FALSE(parse_size("abc").has_value());
    }

    TEST_CASE("sha256")
    {
        CHECK_EQ(sha256("abc"),
                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        CHECK_EQ(sha256(""),
                 "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

        {
            std::ofstream f("sha256.txt", std::ios::binary);
            f << "abc";
        }
        CHECK_EQ(sha256sum("sha256.txt"), sha256("abc"));
    }

    TEST_CASE("rsplit")
    {
        auto parts = rsplit("http://example.com/some/file.tar.bz2", "/", 1);
        REQUIRE_EQ(parts.size(), 2);
        CHECK_EQ(parts[0], "http://example.com/some");
        CHECK_EQ(parts[1], "file.tar.bz2");

        auto none = rsplit("nosep", "/", 1);
        REQUIRE_EQ(none.size(), 1);
        CHECK_EQ(none[0], "nosep");
    }

    TEST_CASE("string_helpers")
    {
        CHECK(starts_with("https://example.com", "https://"));
        CHECK_FALSE(starts_with("http", "https://"));
        CHECK(contains("accept-ranges: bytes", "bytes"));
        CHECK_EQ(to_lower("Accept-Ranges"), "accept-ranges");
    }
}

#include <doctest/doctest.h>

#include <yaml-cpp/yaml.h>

#include <rangeloader/options.hpp>

using namespace rangeloader;
using namespace std::chrono_literals;

TEST_SUITE("options")
{
    TEST_CASE("defaults")
    {
        ClientOptions options;
        CHECK(options.accepts_ranges);
        CHECK_GE(options.num_workers, 1);
        CHECK_EQ(options.chunk_size, 10 * 1024 * 1024);
        CHECK_EQ(options.max_redirects, 16);
        CHECK_EQ(options.timeout, 10s);
        CHECK(options.validate());
    }

    TEST_CASE("validate")
    {
        ClientOptions options;
        options.num_workers = 0;
        auto res = options.validate();
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::RL_BADFUNCARG);

        options = ClientOptions{};
        options.chunk_size = 0;
        CHECK_FALSE(options.validate());

        options = ClientOptions{};
        options.max_redirects = -1;
        CHECK_FALSE(options.validate());

        options = ClientOptions{};
        options.max_redirects = 0;
        options.timeout = 0ms;
        CHECK(options.validate());
    }

    TEST_CASE("from_yaml")
    {
        auto node = YAML::Load(R"(
accept_ranges: false
workers: 3
chunk_size: 512K
max_redirects: 2
timeout: 1.5
)");
        auto options = ClientOptions::from_yaml(node);
        CHECK_FALSE(options.accepts_ranges);
        CHECK_EQ(options.num_workers, 3);
        CHECK_EQ(options.chunk_size, 512 * 1024);
        CHECK_EQ(options.max_redirects, 2);
        CHECK_EQ(options.timeout, 1500ms);
    }

    TEST_CASE("from_yaml_partial")
    {
        auto options = ClientOptions::from_yaml(YAML::Load("chunk_size: 4096"));
        CHECK_EQ(options.chunk_size, 4096);
        CHECK(options.accepts_ranges);
        CHECK_EQ(options.max_redirects, 16);

        auto defaults = ClientOptions::from_yaml(YAML::Node());
        CHECK_EQ(defaults.chunk_size, 10 * 1024 * 1024);
    }

    TEST_CASE("from_yaml_invalid")
    {
        CHECK_THROWS_AS(ClientOptions::from_yaml(YAML::Load("chunk_size: lots")),
                        YAML::Exception);
        CHECK_THROWS_AS(ClientOptions::from_yaml(YAML::Load("workers: many")),
                        YAML::Exception);
        CHECK_THROWS_AS(ClientOptions::from_yaml(YAML::Load("[1, 2]")), YAML::Exception);
    }
}

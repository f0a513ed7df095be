#include <algorithm>
#include <thread>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <rangeloader/options.hpp>
#include <rangeloader/utils.hpp>

namespace rangeloader
{
    int ClientOptions::default_num_workers()
    {
        return std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
    }

    tl::expected<void, DownloadError> ClientOptions::validate() const
    {
        auto bad_option = [](const std::string& reason)
        {
            return tl::unexpected(
                DownloadError{ ErrorLevel::FATAL, ErrorCode::RL_BADFUNCARG, reason });
        };

        if (num_workers <= 0)
            return bad_option(fmt::format("number of workers must be positive, got {}",
                                          num_workers));
        if (chunk_size <= 0)
            return bad_option(fmt::format("chunk size must be positive, got {}", chunk_size));
        if (max_redirects < 0)
            return bad_option(fmt::format("max redirects must not be negative, got {}",
                                          max_redirects));
        if (timeout.count() < 0)
            return bad_option("timeout must not be negative");
        return {};
    }

    ClientOptions ClientOptions::from_yaml(const YAML::Node& node)
    {
        ClientOptions options;
        if (!node || node.IsNull())
            return options;

        if (!node.IsMap())
            throw YAML::RepresentationException(node.Mark(), "client options must be a mapping");

        if (node["accept_ranges"])
            options.accepts_ranges = node["accept_ranges"].as<bool>();

        if (node["workers"])
            options.num_workers = node["workers"].as<int>();

        if (const auto chunk = node["chunk_size"])
        {
            // either a plain byte count or a string with a K/M/G suffix
            auto size = parse_size(chunk.as<std::string>());
            if (!size)
                throw YAML::BadConversion(chunk.Mark());
            options.chunk_size = size.value();
        }

        if (node["max_redirects"])
            options.max_redirects = node["max_redirects"].as<int>();

        if (node["timeout"])
        {
            const auto seconds = node["timeout"].as<double>();
            options.timeout = std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
        }

        return options;
    }
}

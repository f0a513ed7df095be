#ifndef RANGELOADER_OPTIONS_HPP
#define RANGELOADER_OPTIONS_HPP

#include <chrono>
#include <cstdint>

#include <tl/expected.hpp>

#include <rangeloader/export.hpp>
#include <rangeloader/errors.hpp>

namespace YAML
{
    class Node;
}

namespace rangeloader
{
    // Download policy of a `Client`. Read-only once the client is built, so it is shared
    // freely between the workers of a download.
    struct RANGELOADER_API ClientOptions
    {
        // Whether resources that accept ranges are downloaded in parallel chunks.
        bool accepts_ranges = true;

        // Number of workers spawned for a chunked download.
        int num_workers = default_num_workers();

        // Size of an individual chunk, in bytes.
        std::int64_t chunk_size = 10 * 1024 * 1024;

        // Max number of redirects to follow before a request is marked to have failed.
        int max_redirects = 16;

        // Time budget of one top-level call. Zero means unbounded.
        std::chrono::milliseconds timeout = std::chrono::seconds(10);

        static int default_num_workers();

        tl::expected<void, DownloadError> validate() const;

        // Reads `accept_ranges`, `workers`, `chunk_size`, `max_redirects` and `timeout`
        // (seconds) from a YAML mapping, keeping defaults for missing keys.
        // Throws YAML::Exception on ill-typed values.
        static ClientOptions from_yaml(const YAML::Node& node);
    };
}

#endif

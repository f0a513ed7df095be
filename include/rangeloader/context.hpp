#ifndef RANGELOADER_CONTEXT_HPP
#define RANGELOADER_CONTEXT_HPP

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <rangeloader/export.hpp>
#include <rangeloader/curl.hpp>

namespace rangeloader
{
    namespace fs = std::filesystem;

    using proxy_map_type = std::map<std::string, std::string>;

    // Options provided when starting a rangeloader context.
    struct ContextOptions
    {
        // If set, specifies which SSL backend to use with CURL.
        std::optional<ssl_backend_t> ssl_backend;
    };

    // Process-wide transport settings. Owns the global curl initialization, hence there can
    // only be one at any time.
    class RANGELOADER_API Context
    {
    public:
        int verbosity = 0;

        // ssl options
        bool disable_ssl = false;
        fs::path ssl_ca_info;

        long connect_timeout = 30L;
        long low_speed_time = 30L;
        long low_speed_limit = 1000L;

        // This can improve throughput significantly
        // see https://github.com/curl/curl/issues/9601
        long transfer_buffersize = 100 * 1024;

        std::string user_agent = "rangeloader";

        proxy_map_type proxy_map;

        std::vector<std::string> additional_httpheaders;

        void set_verbosity(int v);
        void set_log_level(spdlog::level::level_enum);

        // Throws if another instance already exists: there can only be one at any time!
        Context(ContextOptions options = {});
        ~Context();

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;
        Context(Context&&) = delete;
        Context& operator=(Context&&) = delete;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl;  // Private implementation details
    };

}

#endif

#include <rangeloader/context.hpp>

#include <atomic>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <rangeloader/rangeloader.hpp>

#include "./curl_internal.hpp"


namespace rangeloader
{
    struct Context::Impl
    {
        std::optional<details::CURLSetup> curl_setup;
    };

    static std::atomic<bool> is_context_alive{ false };

    Context::Context(ContextOptions options)
        : impl(new Impl)
    {
        bool expected = false;
        if (!is_context_alive.compare_exchange_strong(expected, true))
            throw std::runtime_error(
                "rangeloader::Context created more than once - instance must be unique");

        try
        {
            impl->curl_setup.emplace(options.ssl_backend);
        }
        catch (...)
        {
            is_context_alive = false;
            throw;
        }

        user_agent = fmt::format("rangeloader/{}.{}.{}",
                                 RANGELOADER_VERSION_MAJOR,
                                 RANGELOADER_VERSION_MINOR,
                                 RANGELOADER_VERSION_PATCH);
        set_verbosity(0);
    }

    Context::~Context()
    {
        impl.reset();
        is_context_alive = false;
    }

    void Context::set_verbosity(int v)
    {
        verbosity = v;
        if (v > 2)
        {
            spdlog::set_level(spdlog::level::warn);
        }
        else if (v > 0)
        {
            spdlog::set_level(spdlog::level::debug);
        }
        else
        {
            spdlog::set_level(spdlog::level::off);
        }
    }

    void Context::set_log_level(spdlog::level::level_enum log_level)
    {
        spdlog::set_level(log_level);
    }
}

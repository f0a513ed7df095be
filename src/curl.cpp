#include <algorithm>
#include <atomic>
#include <charconv>
#include <utility>

#include <spdlog/spdlog.h>

#include <rangeloader/curl.hpp>
#include <rangeloader/context.hpp>
#include <rangeloader/url.hpp>
#include <rangeloader/utils.hpp>

#include "curl_internal.hpp"

namespace rangeloader
{
    /**************
     * curl_error *
     **************/

    curl_error::curl_error(const std::string& what)
        : std::runtime_error(what)
    {
    }


    /**************
     * CURLHandle*
     **************/

    CURLHandle::CURLHandle(const Context& ctx)
        : m_handle(curl_easy_init())
    {
        if (m_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL handle");
        }

        init_handle(ctx);
    }

    void CURLHandle::init_handle(const Context& ctx)
    {
        // Set error buffer
        errorbuffer[0] = '\0';
        setopt(CURLOPT_ERRORBUFFER, errorbuffer);

        // redirects are followed by the client, one hop per transfer
        setopt(CURLOPT_FOLLOWLOCATION, 0L);
        // timeouts from worker threads must not rely on signals
        setopt(CURLOPT_NOSIGNAL, 1L);
        setopt(CURLOPT_CONNECTTIMEOUT, ctx.connect_timeout);
        setopt(CURLOPT_LOW_SPEED_TIME, ctx.low_speed_time);
        setopt(CURLOPT_LOW_SPEED_LIMIT, ctx.low_speed_limit);
        setopt(CURLOPT_BUFFERSIZE, ctx.transfer_buffersize);

        if (ctx.disable_ssl)
        {
            spdlog::warn("SSL verification is disabled");
            setopt(CURLOPT_SSL_VERIFYHOST, 0L);
            setopt(CURLOPT_SSL_VERIFYPEER, 0L);

            // also disable proxy SSL verification
            setopt(CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
            setopt(CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
        }
        else
        {
            setopt(CURLOPT_SSL_VERIFYHOST, 2L);
            setopt(CURLOPT_SSL_VERIFYPEER, 1L);

            if (!ctx.ssl_ca_info.empty())
            {
                setopt(CURLOPT_CAINFO, ctx.ssl_ca_info.string());
            }
        }

        if (ctx.verbosity > 1)
            setopt(CURLOPT_VERBOSE, (long) 1L);
    }

    void CURLHandle::reset(const Context& ctx)
    {
        curl_easy_reset(m_handle);
        reset_headers();
        init_handle(ctx);
    }

    CURLHandle::~CURLHandle()
    {
        if (m_handle)
        {
            curl_easy_cleanup(m_handle);
        }
        if (p_headers)
        {
            curl_slist_free_all(p_headers);
        }
    }

    CURLHandle& CURLHandle::url(const std::string& url, const proxy_map_type& proxies)
    {
        setopt(CURLOPT_URL, url.c_str());
        const auto match = proxy_match(proxies, url);
        if (match)
        {
            setopt(CURLOPT_PROXY, match.value().c_str());
        }
        else
        {
            setopt(CURLOPT_PROXY, nullptr);
        }
        return *this;
    }

    template <class T>
    tl::expected<T, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        T val;
        CURLcode result = curl_easy_getinfo(m_handle, option, &val);
        if (result != CURLE_OK)
            return tl::unexpected(result);
        return val;
    }

    template tl::expected<long, CURLcode> CURLHandle::getinfo(CURLINFO option);
    template tl::expected<char*, CURLcode> CURLHandle::getinfo(CURLINFO option);

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        auto res = getinfo<char*>(option);
        if (res)
            return res.value() ? std::string(res.value()) : std::string();
        else
            return tl::unexpected(res.error());
    }

    CURL* CURLHandle::handle()
    {
        if (p_headers)
            setopt(CURLOPT_HTTPHEADER, p_headers);
        return m_handle;
    }

    CURLHandle& CURLHandle::add_header(const std::string& header)
    {
        p_headers = curl_slist_append(p_headers, header.c_str());
        if (!p_headers)
        {
            throw std::bad_alloc();
        }
        return *this;
    }

    CURLHandle& CURLHandle::add_headers(const std::vector<std::string>& headers)
    {
        for (auto& h : headers)
        {
            add_header(h);
        }
        return *this;
    }

    CURLHandle& CURLHandle::reset_headers()
    {
        curl_slist_free_all(p_headers);
        p_headers = nullptr;
        return *this;
    }

    /************
     * Response *
     ************/

    bool is_redirect_status(long http_status) noexcept
    {
        switch (http_status)
        {
            case 301:
            case 302:
            case 303:
            case 307:
            case 308:
                return true;
            default:
                return false;
        }
    }

    bool Response::ok() const
    {
        return http_status / 100 == 2;
    }

    bool Response::is_redirect() const
    {
        return is_redirect_status(http_status);
    }

    tl::expected<std::string, std::out_of_range> Response::get_header(
        const std::string& header) const
    {
        auto it = headers.find(to_lower(header));
        if (it != headers.end())
            return it->second;
        else
            return tl::unexpected(
                std::out_of_range(std::string("Could not find header ") + header));
    }

    std::int64_t Response::content_length() const
    {
        auto value = get_header("content-length");
        if (!value)
            return -1;

        const std::string& s = value.value();
        std::int64_t length = -1;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), length);
        if (ec != std::errc() || ptr != s.data() + s.size() || length < 0)
            return -1;
        return length;
    }

    nlohmann::json Response::json() const
    {
        try
        {
            return nlohmann::json::parse(content);
        }
        catch (const nlohmann::detail::parse_error& e)
        {
            spdlog::error("Could not parse JSON\n{}", content);
            spdlog::error("Error message: {}", e.what());
            throw;
        }
    }

    void Response::reset()
    {
        headers.clear();
        http_status = 0;
        effective_url.clear();
        content.clear();
    }

    void Response::fill_values(CURLHandle& handle)
    {
        http_status = handle.getinfo<long>(CURLINFO_RESPONSE_CODE).value_or(0);
        effective_url = handle.getinfo<std::string>(CURLINFO_EFFECTIVE_URL).value_or("");
    }

    std::optional<std::string> proxy_match(const proxy_map_type& proxies, const std::string& url)
    {
        // This is a reimplementation of requests.utils.select_proxy()
        // of the python requests library used by conda
        if (proxies.empty())
        {
            return std::nullopt;
        }

        auto handler = URLHandler::parse(url);
        if (!handler)
        {
            return std::nullopt;
        }
        auto scheme = handler->scheme();
        auto host = handler->host();
        std::vector<std::string> options;

        if (host.empty())
        {
            options = {
                scheme,
                "all",
            };
        }
        else
        {
            options = { scheme + "://" + host, scheme, "all://" + host, "all" };
        }

        for (auto& option : options)
        {
            auto proxy = proxies.find(option);
            if (proxy != proxies.end())
            {
                return proxy->second;
            }
        }

        return std::nullopt;
    }

    namespace details
    {
        static std::atomic<bool> is_curl_setup_alive{ false };

        CURLSetup::CURLSetup(const std::optional<ssl_backend_t>& ssl_backend)
        {
            {
                bool expected = false;
                if (!is_curl_setup_alive.compare_exchange_strong(expected, true))
                    throw std::runtime_error(
                        "rangeloader::CURLSetup created more than once - instance must be unique");
            }

            if (ssl_backend)
            {
                const auto res = curl_global_sslset(
                    (curl_sslbackend) ssl_backend.value(), nullptr, nullptr);
                if (res != CURLSSLSET_OK)
                {
                    is_curl_setup_alive = false;
                }
                if (res == CURLSSLSET_UNKNOWN_BACKEND)
                {
                    throw curl_error("unknown curl ssl backend");
                }
                else if (res == CURLSSLSET_NO_BACKENDS)
                {
                    throw curl_error("no curl ssl backend available");
                }
                else if (res == CURLSSLSET_TOO_LATE)
                {
                    throw curl_error("curl ssl backend set too late");
                }
                else if (res != CURLSSLSET_OK)
                {
                    throw curl_error("failed to set curl ssl backend");
                }
            }

            if (curl_global_init(CURL_GLOBAL_ALL) != 0)
            {
                is_curl_setup_alive = false;
                throw curl_error("failed to initialize curl");
            }
        }

        CURLSetup::~CURLSetup()
        {
            curl_global_cleanup();
            is_curl_setup_alive = false;
        }
    }
}

#ifndef RANGELOADER_SRC_CURL_INTERNAL_HPP
#define RANGELOADER_SRC_CURL_INTERNAL_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <fmt/core.h>

#include <rangeloader/export.hpp>
#include <rangeloader/curl.hpp>
#include <rangeloader/context.hpp>

namespace rangeloader
{
    // Raised when an easy handle cannot be created or configured.
    class RANGELOADER_API curl_error : public std::runtime_error
    {
    public:
        explicit curl_error(const std::string& what);
    };

    class RANGELOADER_API CURLHandle
    {
    public:
        explicit CURLHandle(const Context& ctx);
        ~CURLHandle();

        CURLHandle(const CURLHandle&) = delete;
        CURLHandle& operator=(const CURLHandle&) = delete;

        // Drops every per-request option (keeping live connections) and re-applies the
        // context defaults.
        void reset(const Context& ctx);

        CURLHandle& url(const std::string& url, const proxy_map_type& proxies);

        template <class T>
        tl::expected<T, CURLcode> getinfo(CURLINFO option);

        // This is made public because it is used internally in quite some files
        CURL* handle();

        CURLHandle& add_header(const std::string& header);
        CURLHandle& add_headers(const std::vector<std::string>& headers);
        CURLHandle& reset_headers();

        template <class T>
        CURLHandle& setopt(CURLoption opt, const T& val);

        const char* error_buffer() const noexcept
        {
            return errorbuffer;
        }

    private:
        void init_handle(const Context& ctx);

        CURL* m_handle;
        curl_slist* p_headers = nullptr;
        char errorbuffer[CURL_ERROR_SIZE];
    };

    // TODO: restrict the possible implementations in the cpp file
    template <class T>
    CURLHandle& CURLHandle::setopt(CURLoption opt, const T& val)
    {
        CURLcode ok;
        if constexpr (std::is_same<T, std::string>())
        {
            ok = curl_easy_setopt(m_handle, opt, val.c_str());
        }
        else if constexpr (std::is_same<T, bool>())
        {
            ok = curl_easy_setopt(m_handle, opt, val ? 1L : 0L);
        }
        else
        {
            ok = curl_easy_setopt(m_handle, opt, val);
        }
        if (ok != CURLE_OK)
        {
            throw curl_error(
                fmt::format("curl: curl_easy_setopt failed {}", curl_easy_strerror(ok)));
        }
        return *this;
    }

    std::optional<std::string> proxy_match(const proxy_map_type& proxies, const std::string& url);
}

namespace rangeloader::details
{
    // Scoped initialization and termination of CURL.
    // This should never have more than one instance live at any time,
    // this object's constructor will throw an `std::runtime_error` if it's the case.
    class CURLSetup final
    {
    public:
        explicit CURLSetup(const std::optional<ssl_backend_t>& ssl_backend);
        ~CURLSetup();

        CURLSetup(CURLSetup&&) = delete;
        CURLSetup& operator=(CURLSetup&&) = delete;

        CURLSetup(const CURLSetup&) = delete;
        CURLSetup& operator=(const CURLSetup&) = delete;
    };
}
#endif

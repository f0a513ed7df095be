#include <utility>

#include <fmt/format.h>

#include <rangeloader/url.hpp>

namespace rangeloader
{
    URLHandler::URLHandler(CURLU* handle)
        : m_handle(handle)
    {
    }

    tl::expected<URLHandler, std::string> URLHandler::parse(const std::string& url)
    {
        CURLU* handle = curl_url();
        if (handle == nullptr)
            throw std::bad_alloc();

        URLHandler result(handle);
        CURLUcode rc = curl_url_set(handle, CURLUPART_URL, url.c_str(), 0);
        if (rc != CURLUE_OK)
        {
            return tl::unexpected(
                fmt::format("could not parse URL \"{}\" (CURLUcode {})", url, int(rc)));
        }
        return result;
    }

    URLHandler::URLHandler(const URLHandler& rhs)
        : m_handle(curl_url_dup(rhs.m_handle))
    {
        if (m_handle == nullptr)
            throw std::bad_alloc();
    }

    URLHandler& URLHandler::operator=(const URLHandler& rhs)
    {
        URLHandler tmp(rhs);
        std::swap(m_handle, tmp.m_handle);
        return *this;
    }

    URLHandler::URLHandler(URLHandler&& rhs) noexcept
        : m_handle(std::exchange(rhs.m_handle, nullptr))
    {
    }

    URLHandler& URLHandler::operator=(URLHandler&& rhs) noexcept
    {
        std::swap(m_handle, rhs.m_handle);
        return *this;
    }

    URLHandler::~URLHandler()
    {
        if (m_handle)
        {
            curl_url_cleanup(m_handle);
        }
    }

    std::string URLHandler::get_part(CURLUPart part) const
    {
        char* value = nullptr;
        if (curl_url_get(m_handle, part, &value, 0) != CURLUE_OK || value == nullptr)
            return {};

        std::string result(value);
        curl_free(value);
        return result;
    }

    std::string URLHandler::url() const
    {
        return get_part(CURLUPART_URL);
    }

    std::string URLHandler::scheme() const
    {
        return get_part(CURLUPART_SCHEME);
    }

    std::string URLHandler::host() const
    {
        return get_part(CURLUPART_HOST);
    }

    std::string URLHandler::path() const
    {
        return get_part(CURLUPART_PATH);
    }

    tl::expected<URLHandler, std::string> URLHandler::join(const std::string& reference) const
    {
        // setting a relative URL on a handle holding an absolute one resolves it
        URLHandler result(*this);
        CURLUcode rc = curl_url_set(result.m_handle, CURLUPART_URL, reference.c_str(), 0);
        if (rc != CURLUE_OK)
        {
            return tl::unexpected(fmt::format(
                "could not resolve \"{}\" against \"{}\" (CURLUcode {})", reference, url(), int(rc)));
        }
        return result;
    }
}

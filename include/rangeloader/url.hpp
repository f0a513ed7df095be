#ifndef RANGELOADER_URL_HPP
#define RANGELOADER_URL_HPP

#include <string>

#include <tl/expected.hpp>

extern "C"
{
#include <curl/curl.h>
}

#include <rangeloader/export.hpp>

namespace rangeloader
{
    // Thin owner of a libcurl URL handle.
    class RANGELOADER_API URLHandler
    {
    public:
        static tl::expected<URLHandler, std::string> parse(const std::string& url);

        URLHandler(const URLHandler& rhs);
        URLHandler& operator=(const URLHandler& rhs);
        URLHandler(URLHandler&& rhs) noexcept;
        URLHandler& operator=(URLHandler&& rhs) noexcept;
        ~URLHandler();

        std::string url() const;
        std::string scheme() const;
        std::string host() const;
        std::string path() const;

        // Resolves `reference`, absolute or relative, against this URL.
        tl::expected<URLHandler, std::string> join(const std::string& reference) const;

    private:
        explicit URLHandler(CURLU* handle);

        std::string get_part(CURLUPart part) const;

        CURLU* m_handle = nullptr;
    };
}

#endif

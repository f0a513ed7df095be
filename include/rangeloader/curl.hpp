#ifndef RANGELOADER_CURL_HPP
#define RANGELOADER_CURL_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

extern "C"
{
#include <curl/curl.h>
}

#include <rangeloader/export.hpp>
#include <rangeloader/byte_range.hpp>

namespace rangeloader
{
    class CURLHandle;
    class Writer;

    enum class ssl_backend_t
    {
        none = CURLSSLBACKEND_NONE,
        openssl = CURLSSLBACKEND_OPENSSL,
        gnutls = CURLSSLBACKEND_GNUTLS,
        wolfssl = CURLSSLBACKEND_WOLFSSL,
        schannel = CURLSSLBACKEND_SCHANNEL,
        securetransport = CURLSSLBACKEND_SECURETRANSPORT,
        mbedtls = CURLSSLBACKEND_MBEDTLS,
        bearssl = CURLSSLBACKEND_BEARSSL,
        rustls = CURLSSLBACKEND_RUSTLS,
    };

    // Redirect class status codes that carry a Location to follow.
    RANGELOADER_API bool is_redirect_status(long http_status) noexcept;

    struct RANGELOADER_API Request
    {
        // "GET" or "HEAD"
        std::string method = "GET";
        std::string url;
        std::optional<ByteRange> range;
        // Extra raw "Name: value" header lines.
        std::vector<std::string> headers;

        bool is_head() const noexcept
        {
            return method == "HEAD";
        }
    };

    struct RANGELOADER_API Response
    {
        // Lower-cased header names.
        std::map<std::string, std::string> headers;

        long http_status = 0;
        std::string effective_url;

        // Body of the response, unless it was streamed to `body_writer`.
        std::string content;

        // When set, the body of a successful (2xx) response is handed over to this writer
        // instead of being buffered in `content`. Redirect and error bodies are always
        // buffered so that they never reach the destination.
        Writer* body_writer = nullptr;

        bool ok() const;
        bool is_redirect() const;

        tl::expected<std::string, std::out_of_range> get_header(const std::string& header) const;

        // Value of the Content-Length header, -1 when missing or malformed.
        std::int64_t content_length() const;

        nlohmann::json json() const;

        // Clears everything the transport filled in, keeping `body_writer`.
        void reset();

        void fill_values(CURLHandle& handle);
    };

}

#endif

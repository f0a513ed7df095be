#ifndef RANGELOADER_CLIENT_HPP
#define RANGELOADER_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include <rangeloader/export.hpp>
#include <rangeloader/byte_range.hpp>
#include <rangeloader/curl.hpp>
#include <rangeloader/deadline.hpp>
#include <rangeloader/errors.hpp>
#include <rangeloader/options.hpp>
#include <rangeloader/sink.hpp>
#include <rangeloader/transport.hpp>

namespace rangeloader
{
    namespace fs = std::filesystem;

    // What a HEAD request told us about a resource.
    struct RANGELOADER_API ResourceMetadata
    {
        // 0 when unknown
        std::int64_t content_length = 0;
        bool accepts_ranges = false;
    };

    // Redirect-following HTTP client downloading resources either serially or as
    // concurrently fetched byte ranges.
    //
    // Every top-level call is bounded by a single deadline; overloads without one use
    // `options().timeout` from the moment of the call.
    class RANGELOADER_API Client
    {
    public:
        // Throws std::invalid_argument if `options` do not validate.
        explicit Client(Transport& transport, ClientOptions options = {});

        const ClientOptions& options() const noexcept
        {
            return m_options;
        }

        /** Sends `req` and fills `res`, replaying the request on redirects.
         *
         * At most `max_redirects + 1` exchanges are made. On return `req.url` holds the
         * last target requested. Transport errors are returned as is and never retried.
         * A non-redirect response is a success whatever its status code.
         */
        tl::expected<void, DownloadError> execute(Request& req, Response& res);
        tl::expected<void, DownloadError> execute_timeout(Request& req,
                                                          Response& res,
                                                          std::chrono::milliseconds timeout);
        tl::expected<void, DownloadError> execute_deadline(Request& req,
                                                           Response& res,
                                                           const deadline_t& deadline);

        // Learns the length of `url` and whether it can be fetched in ranges.
        // Best effort: any failure is logged and reported as {0, false}.
        ResourceMetadata probe_headers(const std::string& url);
        ResourceMetadata probe_headers(const std::string& url, const deadline_t& deadline);

        // Picks the chunked strategy when both the client and the resource allow ranges and
        // the length is known, the serial one otherwise.
        tl::expected<void, DownloadError> download(Sink& sink,
                                                   const std::string& url,
                                                   const ResourceMetadata& metadata,
                                                   const deadline_t& deadline);

        // Downloads `url` into memory, reusing the capacity of `existing`.
        // On failure the bytes received so far are discarded along with the buffer.
        tl::expected<std::vector<char>, DownloadError> download_to_bytes(
            std::vector<char> existing, const std::string& url);

        // Downloads `url` into a newly created (or truncated) file.
        // On failure the partially written file is left in place.
        tl::expected<void, DownloadError> download_to_file(const fs::path& path,
                                                           const std::string& url);

        tl::expected<void, DownloadError> download_serially(Writer& sink, const std::string& url);
        tl::expected<void, DownloadError> download_serially(Writer& sink,
                                                            const std::string& url,
                                                            const deadline_t& deadline);

        /** Downloads the `length` bytes of `url` as ranges of `chunk_size` bytes.
         *
         * `num_workers` workers fetch the ranges handed over by a bounded queue and write
         * each one at its offset in `sink`. Feeding stops when the deadline elapses or a
         * worker fails; ranges already queued are still processed. Only the first worker
         * error is reported and nothing written so far is rolled back.
         */
        tl::expected<void, DownloadError> download_in_chunks(Sink& sink,
                                                             const std::string& url,
                                                             std::int64_t length);
        tl::expected<void, DownloadError> download_in_chunks(Sink& sink,
                                                             const std::string& url,
                                                             std::int64_t length,
                                                             const deadline_t& deadline);

    private:
        tl::expected<void, DownloadError> fetch_range(Request& req,
                                                      Response& res,
                                                      Sink& sink,
                                                      const ByteRange& range,
                                                      const deadline_t& deadline);

        deadline_t default_deadline() const;

        Transport& m_transport;
        const ClientOptions m_options;
    };
}

#endif

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <rangeloader/client.hpp>
#include <rangeloader/url.hpp>

namespace rangeloader
{
    namespace
    {
        // Location values may be relative to the URL that was redirected.
        tl::expected<std::string, std::string> resolve_location(const std::string& current,
                                                                const std::string& location)
        {
            auto base = URLHandler::parse(current);
            auto target = base ? base->join(location) : URLHandler::parse(location);
            if (!target)
                return tl::unexpected(target.error());
            return target->url();
        }
    }

    Client::Client(Transport& transport, ClientOptions options)
        : m_transport(transport)
        , m_options(std::move(options))
    {
        auto valid = m_options.validate();
        if (!valid)
            throw std::invalid_argument(valid.error().reason);
    }

    deadline_t Client::default_deadline() const
    {
        return deadline_after(m_options.timeout);
    }

    tl::expected<void, DownloadError> Client::execute(Request& req, Response& res)
    {
        return execute_deadline(req, res, default_deadline());
    }

    tl::expected<void, DownloadError> Client::execute_timeout(Request& req,
                                                              Response& res,
                                                              std::chrono::milliseconds timeout)
    {
        return execute_deadline(req, res, deadline_after(timeout));
    }

    tl::expected<void, DownloadError> Client::execute_deadline(Request& req,
                                                               Response& res,
                                                               const deadline_t& deadline)
    {
        for (int i = 0; i <= m_options.max_redirects; ++i)
        {
            auto performed = m_transport.perform_deadline(req, res, deadline);
            if (!performed)
            {
                return performed;
            }

            if (!res.is_redirect())
            {
                return {};
            }

            auto location = res.get_header("location");
            if (!location || location.value().empty())
            {
                return tl::unexpected(DownloadError{
                    ErrorLevel::SERIOUS,
                    ErrorCode::RL_MISSING_LOCATION,
                    fmt::format("missing 'Location' header after redirect ({}) from {}",
                                res.http_status,
                                req.url) });
            }

            auto target = resolve_location(req.url, location.value());
            if (!target)
            {
                return tl::unexpected(DownloadError{
                    ErrorLevel::SERIOUS,
                    ErrorCode::RL_MISSING_LOCATION,
                    fmt::format("unusable 'Location' header after redirect from {}: {}",
                                req.url,
                                target.error()) });
            }

            spdlog::debug("Redirected ({}) from {} to {}", res.http_status, req.url, target.value());
            req.url = std::move(target.value());
            res.reset();
        }

        return tl::unexpected(
            DownloadError{ ErrorLevel::SERIOUS,
                           ErrorCode::RL_TOO_MANY_REDIRECTS,
                           fmt::format("redirected too many times (more than {}) while requesting {}",
                                       m_options.max_redirects,
                                       req.url) });
    }

    ResourceMetadata Client::probe_headers(const std::string& url)
    {
        return probe_headers(url, default_deadline());
    }

    ResourceMetadata Client::probe_headers(const std::string& url, const deadline_t& deadline)
    {
        ResourceMetadata metadata;

        Request req;
        req.method = "HEAD";
        req.url = url;
        Response res;

        auto performed = execute_deadline(req, res, deadline);
        if (!performed)
        {
            spdlog::warn("Could not query headers of {}: {}", url, performed.error().reason);
            return metadata;
        }
        if (!res.ok())
        {
            spdlog::warn("Could not query headers of {}: server returned {}", url, res.http_status);
            return metadata;
        }

        metadata.content_length = std::max<std::int64_t>(res.content_length(), 0);
        metadata.accepts_ranges = res.get_header("accept-ranges").value_or("") == "bytes";

        spdlog::debug("{}: content length {}, accepts ranges: {}",
                      url,
                      metadata.content_length,
                      metadata.accepts_ranges);
        return metadata;
    }

    tl::expected<void, DownloadError> Client::download(Sink& sink,
                                                       const std::string& url,
                                                       const ResourceMetadata& metadata,
                                                       const deadline_t& deadline)
    {
        if (m_options.accepts_ranges && metadata.accepts_ranges && metadata.content_length > 0)
        {
            spdlog::info("Downloading {} ({} bytes) in chunks of {} bytes with {} workers",
                         url,
                         metadata.content_length,
                         m_options.chunk_size,
                         m_options.num_workers);
            return download_in_chunks(sink, url, metadata.content_length, deadline);
        }

        spdlog::info("Downloading {} serially", url);
        return download_serially(sink, url, deadline);
    }

    tl::expected<std::vector<char>, DownloadError> Client::download_to_bytes(
        std::vector<char> existing, const std::string& url)
    {
        const auto deadline = default_deadline();
        const auto metadata = probe_headers(url, deadline);

        MemorySink sink(std::move(existing));
        // the advertised length is only a hint, the download reports real shortages
        auto reserved = metadata.content_length > 0
                            ? sink.reserve(static_cast<std::size_t>(metadata.content_length))
                            : tl::expected<void, DownloadError>();
        if (!reserved)
        {
            spdlog::warn("Not preallocating {} byte(s) for {}: {}",
                         metadata.content_length,
                         url,
                         reserved.error().reason);
        }

        auto downloaded = download(sink, url, metadata, deadline);
        if (!downloaded)
        {
            return tl::unexpected(downloaded.error());
        }
        return sink.release();
    }

    tl::expected<void, DownloadError> Client::download_to_file(const fs::path& path,
                                                               const std::string& url)
    {
        const auto deadline = default_deadline();
        const auto metadata = probe_headers(url, deadline);

        auto sink = FileSink::create(path, metadata.content_length);
        if (!sink)
        {
            return tl::unexpected(sink.error());
        }

        auto downloaded = download(*sink.value(), url, metadata, deadline);
        auto closed = sink.value()->close();
        if (!downloaded)
        {
            return downloaded;
        }
        return closed;
    }

    tl::expected<void, DownloadError> Client::download_serially(Writer& sink,
                                                                const std::string& url)
    {
        return download_serially(sink, url, default_deadline());
    }

    tl::expected<void, DownloadError> Client::download_serially(Writer& sink,
                                                                const std::string& url,
                                                                const deadline_t& deadline)
    {
        Request req;
        req.url = url;
        Response res;
        res.body_writer = &sink;

        auto performed = execute_deadline(req, res, deadline);
        if (!performed)
        {
            return tl::unexpected(
                performed.error().wrap(fmt::format("failed to download \"{}\"", url)));
        }

        if (!res.ok())
        {
            return tl::unexpected(
                DownloadError{ ErrorLevel::SERIOUS,
                               ErrorCode::RL_BADSTATUS,
                               fmt::format("failed to download \"{}\": server returned {}",
                                           url,
                                           res.http_status) });
        }
        return {};
    }
}

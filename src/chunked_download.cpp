#include <mutex>
#include <exception>
#include <optional>
#include <system_error>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <rangeloader/bounded_queue.hpp>
#include <rangeloader/client.hpp>

namespace rangeloader
{
    tl::expected<void, DownloadError> Client::fetch_range(Request& req,
                                                          Response& res,
                                                          Sink& sink,
                                                          const ByteRange& range,
                                                          const deadline_t& deadline)
    {
        // the body goes straight to its final position, capped to the range size
        OffsetWriter writer(sink, range.start, range.size());
        req.range = range;
        res.body_writer = &writer;

        auto performed = execute_deadline(req, res, deadline);
        res.body_writer = nullptr;
        if (!performed)
        {
            return performed;
        }

        if (!res.ok())
        {
            return tl::unexpected(DownloadError{ ErrorLevel::SERIOUS,
                                                 ErrorCode::RL_BADSTATUS,
                                                 fmt::format("server returned {} for {}",
                                                             res.http_status,
                                                             req.url) });
        }

        if (writer.written() != range.size())
        {
            return tl::unexpected(
                DownloadError{ ErrorLevel::SERIOUS,
                               ErrorCode::RL_RANGE_MISMATCH,
                               fmt::format("received {} of the {} byte(s) requested",
                                           writer.written(),
                                           range.size()) });
        }
        return {};
    }

    tl::expected<void, DownloadError> Client::download_in_chunks(Sink& sink,
                                                                 const std::string& url,
                                                                 std::int64_t length)
    {
        return download_in_chunks(sink, url, length, default_deadline());
    }

    tl::expected<void, DownloadError> Client::download_in_chunks(Sink& sink,
                                                                 const std::string& url,
                                                                 std::int64_t length,
                                                                 const deadline_t& deadline)
    {
        if (length <= 0)
        {
            return tl::unexpected(DownloadError{
                ErrorLevel::SERIOUS,
                ErrorCode::RL_UNKNOWN_CONTENT_LENGTH,
                fmt::format("cannot download \"{}\" in chunks: content length is {}", url, length) });
        }

        BoundedQueue<ByteRange> queue(static_cast<std::size_t>(m_options.num_workers));

        std::mutex error_mutex;
        std::optional<DownloadError> first_error;

        auto worker = [&](int id)
        {
            Request req;
            req.url = url;
            Response res;

            ByteRange range;
            while (queue.pop(range))
            {
                tl::expected<void, DownloadError> fetched;
                try
                {
                    fetched = fetch_range(req, res, sink, range, deadline);
                }
                catch (const std::exception& e)
                {
                    // nothing may escape the thread, a sink or transport throwing is a failure
                    res.body_writer = nullptr;
                    fetched = tl::unexpected(
                        DownloadError{ ErrorLevel::FATAL, ErrorCode::RL_UNKNOWNERROR, e.what() });
                }
                if (!fetched)
                {
                    const DownloadError& error = fetched.error();
                    DownloadError wrapped
                        = error.code == ErrorCode::RL_SINK_WRITE
                              ? error.wrap(ErrorCode::RL_SINK_WRITE,
                                           fmt::format("worker {} failed to write at offset {}",
                                                       id,
                                                       range.start))
                              : error.wrap(ErrorCode::RL_CHUNK_FETCH,
                                           fmt::format("worker {} failed to get bytes range "
                                                       "(start: {}, end: {})",
                                                       id,
                                                       range.start,
                                                       range.end));
                    spdlog::debug(wrapped.reason);
                    {
                        std::lock_guard<std::mutex> lock(error_mutex);
                        if (!first_error)
                        {
                            first_error = std::move(wrapped);
                        }
                    }
                    // stop the feeding; siblings still drain what is queued
                    queue.close();
                    return;
                }
                spdlog::debug("worker {} got bytes {}-{} of {}", id, range.start, range.end, url);
            }
        };

        std::vector<std::thread> workers;
        workers.reserve(static_cast<std::size_t>(m_options.num_workers));
        try
        {
            for (int i = 0; i < m_options.num_workers; ++i)
            {
                workers.emplace_back(worker, i);
            }
        }
        catch (const std::system_error& e)
        {
            queue.close();
            for (auto& t : workers)
            {
                t.join();
            }
            return tl::unexpected(
                DownloadError{ ErrorLevel::FATAL,
                               ErrorCode::RL_UNKNOWNERROR,
                               fmt::format("could not start download workers: {}", e.what()) });
        }

        // Fill up the queue with the byte ranges to download, until the deadline.
        RangeSequence ranges(length, m_options.chunk_size);
        std::int64_t dispatched = 0;
        bool timed_out = false;
        while (auto range = ranges.next())
        {
            const auto status = queue.push_until(range.value(), deadline);
            if (status == QueueStatus::kTIMEOUT)
            {
                spdlog::warn("Deadline reached while dispatching {}: {} of {} range(s) dispatched",
                             url,
                             dispatched,
                             ranges.count());
                timed_out = true;
                break;
            }
            if (status == QueueStatus::kCLOSED)
            {
                break;
            }
            ++dispatched;
        }

        queue.close();

        // Wait until all dispatched byte ranges have been downloaded or have failed.
        for (auto& t : workers)
        {
            t.join();
        }

        if (first_error)
        {
            return tl::unexpected(
                first_error->wrap(fmt::format("failed to download \"{}\" in chunks", url)));
        }

        if (timed_out)
        {
            return tl::unexpected(DownloadError{
                ErrorLevel::SERIOUS,
                ErrorCode::RL_TIMEOUT,
                fmt::format("failed to download \"{}\" in chunks: deadline exceeded after "
                            "dispatching {} of {} range(s)",
                            url,
                            dispatched,
                            ranges.count()) });
        }
        return {};
    }
}

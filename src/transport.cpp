#include <algorithm>
#include <exception>
#include <optional>
#include <string_view>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <rangeloader/transport.hpp>
#include <rangeloader/context.hpp>
#include <rangeloader/sink.hpp>
#include <rangeloader/utils.hpp>

#include "curl_internal.hpp"

namespace rangeloader
{
    namespace
    {
        struct TransferState
        {
            CURLHandle* handle;
            Response* response;
            // decided on the first body bytes, once the status code is known
            std::optional<bool> stream_body;
            std::optional<DownloadError> write_error;
        };

        std::size_t header_callback(char* buffer,
                                    std::size_t size,
                                    std::size_t nitems,
                                    TransferState* state)
        {
            std::string_view line(buffer, size * nitems);
            if (starts_with(line, "HTTP/"))
            {
                // a new header block starts (e.g. after "100 Continue")
                state->response->headers.clear();
            }
            else
            {
                auto kv = parse_header(line);
                if (!kv.first.empty())
                {
                    state->response->headers[kv.first] = kv.second;
                }
            }
            return size * nitems;
        }

        std::size_t write_callback(char* buffer,
                                   std::size_t size,
                                   std::size_t nitems,
                                   TransferState* state)
        {
            const std::size_t total = size * nitems;
            Response& response = *state->response;

            if (!state->stream_body)
            {
                const long status
                    = state->handle->getinfo<long>(CURLINFO_RESPONSE_CODE).value_or(0);
                state->stream_body = response.body_writer != nullptr && status / 100 == 2;
            }

            // exceptions must not cross curl's C frames, they abort the transfer instead
            try
            {
                if (state->stream_body.value())
                {
                    auto written = response.body_writer->write(buffer, total);
                    if (!written)
                    {
                        state->write_error = written.error();
                        // returning less than `total` makes curl abort with CURLE_WRITE_ERROR
                        return 0;
                    }
                    return total;
                }

                response.content.append(buffer, total);
            }
            catch (const std::exception& e)
            {
                state->write_error = DownloadError{ ErrorLevel::FATAL,
                                                    ErrorCode::RL_SINK_WRITE,
                                                    fmt::format("failed to store {} byte(s): {}",
                                                                total,
                                                                e.what()) };
                return 0;
            }
            return total;
        }

        DownloadError transport_error(ErrorCode code, const std::string& url, std::string reason)
        {
            return DownloadError{ ErrorLevel::SERIOUS,
                                  code,
                                  fmt::format("request to {} failed: {}", url, reason) };
        }
    }

    CurlTransport::CurlTransport(const Context& ctx)
        : m_ctx(ctx)
    {
    }

    CurlTransport::~CurlTransport() = default;

    std::unique_ptr<CURLHandle> CurlTransport::acquire_handle()
    {
        {
            std::lock_guard<std::mutex> lock(m_idle_mutex);
            if (!m_idle_handles.empty())
            {
                auto handle = std::move(m_idle_handles.back());
                m_idle_handles.pop_back();
                handle->reset(m_ctx);
                return handle;
            }
        }
        return std::make_unique<CURLHandle>(m_ctx);
    }

    void CurlTransport::release_handle(std::unique_ptr<CURLHandle> handle)
    {
        std::lock_guard<std::mutex> lock(m_idle_mutex);
        m_idle_handles.push_back(std::move(handle));
    }

    tl::expected<void, DownloadError> CurlTransport::perform_deadline(const Request& req,
                                                                      Response& res,
                                                                      const deadline_t& deadline)
    {
        if (expired(deadline))
        {
            return tl::unexpected(
                transport_error(ErrorCode::RL_TIMEOUT, req.url, "deadline exceeded"));
        }

        res.reset();

        std::unique_ptr<CURLHandle> handle;
        CURL* easy = nullptr;
        TransferState state{ nullptr, &res, std::nullopt, std::nullopt };
        try
        {
            handle = acquire_handle();
            state.handle = handle.get();

            handle->url(req.url, m_ctx.proxy_map);
            if (req.is_head())
            {
                handle->setopt(CURLOPT_NOBODY, 1L);
            }
            else
            {
                handle->setopt(CURLOPT_HTTPGET, 1L);
            }

            if (req.range)
            {
                handle->setopt(CURLOPT_RANGE, req.range->to_header());
            }

            if (deadline)
            {
                const long timeout_ms = static_cast<long>(remaining(deadline).count());
                // 0 would mean "no timeout" to curl
                handle->setopt(CURLOPT_TIMEOUT_MS, std::max(timeout_ms, 1L));
            }

            handle->add_header(fmt::format("User-Agent: {} {}", m_ctx.user_agent, curl_version()));
            handle->add_headers(m_ctx.additional_httpheaders);
            handle->add_headers(req.headers);

            handle->setopt(CURLOPT_HEADERFUNCTION, header_callback);
            handle->setopt(CURLOPT_HEADERDATA, &state);
            handle->setopt(CURLOPT_WRITEFUNCTION, write_callback);
            handle->setopt(CURLOPT_WRITEDATA, &state);
            easy = handle->handle();
        }
        catch (const curl_error& e)
        {
            return tl::unexpected(transport_error(ErrorCode::RL_CURL, req.url, e.what()));
        }

        spdlog::debug("{} {}{}",
                      req.method,
                      req.url,
                      req.range ? fmt::format(" [bytes={}]", req.range->to_header()) : "");

        const CURLcode result = curl_easy_perform(easy);
        res.fill_values(*handle);

        std::optional<DownloadError> error;
        if (result != CURLE_OK)
        {
            if (state.write_error)
            {
                error = state.write_error;
            }
            else
            {
                const auto code = result == CURLE_OPERATION_TIMEDOUT ? ErrorCode::RL_TIMEOUT
                                                                     : ErrorCode::RL_CURL;
                error = transport_error(
                    code,
                    req.url,
                    fmt::format("{} [{}]", curl_easy_strerror(result), handle->error_buffer()));
            }
        }

        release_handle(std::move(handle));

        if (error)
        {
            return tl::unexpected(std::move(error.value()));
        }
        spdlog::debug("{} {} -> {}", req.method, req.url, res.http_status);
        return {};
    }
}

#ifndef RANGELOADER_TRANSPORT_HPP
#define RANGELOADER_TRANSPORT_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

#include <tl/expected.hpp>

#include <rangeloader/export.hpp>
#include <rangeloader/curl.hpp>
#include <rangeloader/deadline.hpp>
#include <rangeloader/errors.hpp>

namespace rangeloader
{
    class Context;
    class CURLHandle;

    // A single request/response exchange. Implementations never follow redirects
    // themselves and must be callable from several threads at once.
    class RANGELOADER_API Transport
    {
    public:
        virtual ~Transport() = default;

        tl::expected<void, DownloadError> perform(const Request& req, Response& res)
        {
            return perform_deadline(req, res, std::nullopt);
        }

        tl::expected<void, DownloadError> perform_timeout(const Request& req,
                                                          Response& res,
                                                          std::chrono::milliseconds timeout)
        {
            return perform_deadline(req, res, deadline_after(timeout));
        }

        // Fails with RL_TIMEOUT once `deadline` has elapsed.
        virtual tl::expected<void, DownloadError> perform_deadline(const Request& req,
                                                                   Response& res,
                                                                   const deadline_t& deadline)
            = 0;
    };

    class RANGELOADER_API CurlTransport : public Transport
    {
    public:
        explicit CurlTransport(const Context& ctx);
        ~CurlTransport() override;

        CurlTransport(const CurlTransport&) = delete;
        CurlTransport& operator=(const CurlTransport&) = delete;

        tl::expected<void, DownloadError> perform_deadline(const Request& req,
                                                           Response& res,
                                                           const deadline_t& deadline) override;

    private:
        std::unique_ptr<CURLHandle> acquire_handle();
        void release_handle(std::unique_ptr<CURLHandle> handle);

        const Context& m_ctx;
        std::mutex m_idle_mutex;
        // easy handles kept around so that their connections get reused
        std::vector<std::unique_ptr<CURLHandle>> m_idle_handles;
    };
}

#endif

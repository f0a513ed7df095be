#ifndef RANGELOADER_ENUMS_HPP
#define RANGELOADER_ENUMS_HPP

#include <rangeloader/export.hpp>

namespace rangeloader
{
    /** rangeloader return/error codes */
    enum class ErrorCode
    {
        // everything is ok
        RL_OK,
        // bad function argument or invalid client options
        RL_BADFUNCARG,
        // cURL error (the transport failed to complete the exchange)
        RL_CURL,
        // the deadline elapsed before or during the exchange
        RL_TIMEOUT,
        // redirect status received without a Location header
        RL_MISSING_LOCATION,
        // redirect chain longer than the configured maximum
        RL_TOO_MANY_REDIRECTS,
        // HTTP returned a final status code which does not represent success
        RL_BADSTATUS,
        // range download attempted without a positive content length
        RL_UNKNOWN_CONTENT_LENGTH,
        // a worker failed to fetch its byte range
        RL_CHUNK_FETCH,
        // server returned a different number of bytes than the range asked for
        RL_RANGE_MISMATCH,
        // writing into the sink failed
        RL_SINK_WRITE,
        // destination file could not be created
        RL_FILE_CREATE,
        // destination file could not be resized
        RL_FILE_TRUNCATE,
        // downloaded content does not match the expected checksum
        RL_BADCHECKSUM,
        // (xx) unknown error - sentinel of error codes enum
        RL_UNKNOWNERROR,
    };

    enum ErrorLevel
    {
        INFO,
        SERIOUS,
        FATAL
    };

    enum class QueueStatus
    {
        kOK,
        // the deadline elapsed while the queue was full
        kTIMEOUT,
        // the queue was closed, nothing more is accepted
        kCLOSED,
    };

    RANGELOADER_API const char* to_string(ErrorCode code) noexcept;
}

#endif

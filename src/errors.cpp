#include <rangeloader/errors.hpp>

#include <fmt/format.h>

namespace rangeloader
{
    const char* to_string(ErrorCode code) noexcept
    {
        switch (code)
        {
            case ErrorCode::RL_OK:
                return "ok";
            case ErrorCode::RL_BADFUNCARG:
                return "bad function argument";
            case ErrorCode::RL_CURL:
                return "transport error";
            case ErrorCode::RL_TIMEOUT:
                return "timeout";
            case ErrorCode::RL_MISSING_LOCATION:
                return "missing location header";
            case ErrorCode::RL_TOO_MANY_REDIRECTS:
                return "too many redirects";
            case ErrorCode::RL_BADSTATUS:
                return "bad status";
            case ErrorCode::RL_UNKNOWN_CONTENT_LENGTH:
                return "unknown content length";
            case ErrorCode::RL_CHUNK_FETCH:
                return "chunk fetch failed";
            case ErrorCode::RL_RANGE_MISMATCH:
                return "range length mismatch";
            case ErrorCode::RL_SINK_WRITE:
                return "sink write failed";
            case ErrorCode::RL_FILE_CREATE:
                return "file create failed";
            case ErrorCode::RL_FILE_TRUNCATE:
                return "file truncate failed";
            case ErrorCode::RL_BADCHECKSUM:
                return "bad checksum";
            default:
                return "unknown error";
        }
    }

    DownloadError DownloadError::wrap(ErrorCode outer, const std::string& context) const
    {
        return DownloadError{ level, outer, fmt::format("{}: {}", context, reason), root_cause() };
    }

    DownloadError DownloadError::wrap(const std::string& context) const
    {
        return DownloadError{ level, code, fmt::format("{}: {}", context, reason), cause };
    }
}

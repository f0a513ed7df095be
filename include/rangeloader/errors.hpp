#ifndef RANGELOADER_ERRORS_HPP
#define RANGELOADER_ERRORS_HPP

#include <string>

#include <spdlog/spdlog.h>

#include <rangeloader/export.hpp>
#include <rangeloader/enums.hpp>

namespace rangeloader
{
    struct RANGELOADER_API DownloadError
    {
        ErrorLevel level = ErrorLevel::SERIOUS;
        ErrorCode code = ErrorCode::RL_UNKNOWNERROR;
        std::string reason;
        // Code of the innermost error when this one wraps another.
        ErrorCode cause = ErrorCode::RL_OK;

        bool is_serious() const noexcept
        {
            return (level == ErrorLevel::SERIOUS || level == ErrorLevel::FATAL);
        }

        bool is_fatal() const noexcept
        {
            return level == ErrorLevel::FATAL;
        }

        // The innermost error code, or `code` itself for an unwrapped error.
        ErrorCode root_cause() const noexcept
        {
            return cause == ErrorCode::RL_OK ? code : cause;
        }

        // Returns a copy that keeps the root cause and prefixes `context` to the reason.
        DownloadError wrap(ErrorCode outer, const std::string& context) const;
        DownloadError wrap(const std::string& context) const;

        void log() const
        {
            switch (level)
            {
                case ErrorLevel::FATAL:
                    spdlog::critical(reason);
                    break;
                case ErrorLevel::SERIOUS:
                    spdlog::error(reason);
                    break;
                default:
                    spdlog::warn(reason);
            }
        }
    };
}

#endif

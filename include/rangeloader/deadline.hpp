#ifndef RANGELOADER_DEADLINE_HPP
#define RANGELOADER_DEADLINE_HPP

#include <chrono>
#include <optional>

namespace rangeloader
{
    using clock_type = std::chrono::steady_clock;

    // An absolute point in time bounding a whole operation.
    // An empty deadline means the operation is unbounded.
    using deadline_t = std::optional<clock_type::time_point>;

    // A deadline `timeout` from now, unbounded for a zero or negative timeout.
    template <class Rep, class Period>
    inline deadline_t deadline_after(std::chrono::duration<Rep, Period> timeout)
    {
        if (timeout <= std::chrono::duration<Rep, Period>::zero())
            return std::nullopt;
        return clock_type::now()
               + std::chrono::duration_cast<clock_type::duration>(timeout);
    }

    inline bool expired(const deadline_t& deadline)
    {
        return deadline && clock_type::now() >= *deadline;
    }

    // Time left until `deadline`, clamped at zero. Only meaningful for a bounded deadline.
    inline std::chrono::milliseconds remaining(const deadline_t& deadline)
    {
        if (!deadline)
            return std::chrono::milliseconds::max();
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline
                                                                          - clock_type::now());
        return left.count() > 0 ? left : std::chrono::milliseconds::zero();
    }
}

#endif

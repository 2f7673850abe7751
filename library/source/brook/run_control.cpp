#include "brook/run_control.hpp"

namespace brook {

auto operator<<(std::ostream& os, stop_reason value) -> std::ostream&
{
    switch (value) {
    case stop_reason::cancelled:
        os << "cancelled";
        return os;
    case stop_reason::aborted:
        os << "aborted";
        return os;
    case stop_reason::finished:
        os << "finished";
        return os;
    }
    os << "stop_reason(" << static_cast<int>(value) << ")";
    return os;
}

auto run_control::request_stop(stop_reason why) -> bool
{
    {
        const std::lock_guard lock{mutex};
        if (stopped) {
            return false;
        }
        stopped = why;
    }
    cv.notify_all();
    return true;
}

auto run_control::stop_requested() const -> bool
{
    const std::lock_guard lock{mutex};
    return stopped.has_value();
}

auto run_control::reason() const -> std::optional<stop_reason>
{
    const std::lock_guard lock{mutex};
    return stopped;
}

auto run_control::wait_for(std::chrono::nanoseconds timeout) const -> bool
{
    return wait_until(std::chrono::steady_clock::now() + timeout);
}

auto run_control::wait_until(std::chrono::steady_clock::time_point when) const
    -> bool
{
    std::unique_lock lk(mutex);
    return cv.wait_until(lk, when, [this]{
        return stopped.has_value();
    });
}

}

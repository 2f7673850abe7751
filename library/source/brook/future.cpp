#include <string>

#include "brook/future.hpp"

namespace brook {

wait_timed_out::wait_timed_out(std::chrono::milliseconds timeout):
    std::runtime_error{"wait timed out after " +
                       std::to_string(timeout.count()) + "ms"},
    timeout_{timeout}
{
    // Intentionally empty.
}

auto wait_timed_out::timeout() const noexcept -> std::chrono::milliseconds
{
    return timeout_;
}

}

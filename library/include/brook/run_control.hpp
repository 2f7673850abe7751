#ifndef run_control_hpp
#define run_control_hpp

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <ostream>

namespace brook {

/// @brief Why a run was asked to stop.
enum class stop_reason: int {
    /// @brief Stopped through a <code>cancellable</code>.
    cancelled,
    /// @brief Stopped by the owner of the run (its handle or materializer).
    aborted,
    /// @brief The run ended, whether completing, cancelled, or failing.
    /// @note Seals the control against later requests to stop.
    finished,
};

auto operator<<(std::ostream& os, stop_reason value) -> std::ostream&;

/// @brief Cooperative stop signal shared by the stages of one run.
/// @note Only the first stop request takes effect. Its reason sticks.
/// @note Sources poll or wait on this. Nothing is ever interrupted
///   preemptively.
struct run_control
{
    /// @return <code>true</code> if this call was the one that stopped the
    ///   run, <code>false</code> if it had already been asked to stop.
    auto request_stop(stop_reason why) -> bool;

    [[nodiscard]] auto stop_requested() const -> bool;

    [[nodiscard]] auto reason() const -> std::optional<stop_reason>;

    /// @brief Waits until stopped or the timeout elapses.
    /// @return <code>true</code> if stopped.
    auto wait_for(std::chrono::nanoseconds timeout) const -> bool;

    /// @brief Waits until stopped or the given time is reached.
    /// @return <code>true</code> if stopped.
    auto wait_until(std::chrono::steady_clock::time_point when) const -> bool;

private:
    mutable std::mutex mutex;
    mutable std::condition_variable cv;
    std::optional<stop_reason> stopped;
};

}

#endif /* run_control_hpp */

#ifndef cancellable_hpp
#define cancellable_hpp

#include <memory> // for std::shared_ptr
#include <ostream>

#include "brook/run_control.hpp"

namespace brook {

/// @brief Cancellation capability of a run.
/// @details Materialized by stages like <code>sources::tick</code> whose
///   runs won't otherwise end. Cancelling stops further resource use, like
///   further timer ticks, and completes the run. It doesn't undo elements
///   already emitted.
/// @note Copies refer to the same run. A default constructed instance refers
///   to none and is considered already cancelled.
struct cancellable
{
    cancellable() noexcept = default;

    explicit cancellable(std::shared_ptr<run_control> control) noexcept;

    /// @brief Cancels the associated run.
    /// @return <code>true</code> if this call cancelled the run,
    ///   <code>false</code> if the run was already stopping or had ended.
    auto cancel() const -> bool;

    /// @brief Whether the associated run was cancelled or aborted.
    /// @note A run that ended on its own isn't cancelled.
    [[nodiscard]] auto is_cancelled() const -> bool;

    /// @brief Whether the associated run ended or was asked to stop.
    [[nodiscard]] auto is_stopped() const -> bool;

    auto operator==(const cancellable& other) const noexcept -> bool = default;

private:
    std::shared_ptr<run_control> control;
};

auto operator<<(std::ostream& os, const cancellable& value) -> std::ostream&;

}

#endif /* cancellable_hpp */

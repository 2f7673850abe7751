#ifndef run_handle_hpp
#define run_handle_hpp

#include <chrono>
#include <future>
#include <memory> // for std::shared_ptr
#include <string>
#include <type_traits> // for std::is_default_constructible_v

#include "brook/run_state.hpp"
#include "brook/stage.hpp" // for run_id

namespace brook {

/// @brief Handle to one run of a blueprint.
/// @note Provides RAII-styled ownership of the run. Destroying a handle of a
///   run that hasn't finished aborts the run and waits for it to end.
///   Hand the handle to <code>materializer::adopt</code> to let the run
///   continue on its own.
/// @note This type is intended to be moveable, but not copyable.
/// @see materializer.
struct run_handle
{
    struct impl;

    run_handle() noexcept;
    run_handle(std::shared_ptr<impl> state, std::future<void> runner) noexcept;
    run_handle(const run_handle& other) = delete;
    run_handle(run_handle&& other) noexcept;
    ~run_handle();

    auto operator=(const run_handle& other) -> run_handle& = delete;
    auto operator=(run_handle&& other) noexcept -> run_handle&;

    /// @brief Whether this handle is associated with a run.
    [[nodiscard]] auto valid() const noexcept -> bool;

    [[nodiscard]] auto id() const noexcept -> run_id;

    /// @brief Name of the run as it appears in diagnostics.
    [[nodiscard]] auto name() const -> std::string;

    /// @brief Current state of the run.
    /// @note This is an observer function.
    /// @return <code>run_created{}</code> if this has no associated run.
    [[nodiscard]] auto state() const -> run_state;

    /// @brief Waits for the run to end.
    auto wait() -> run_state;

    /// @brief Waits for the run to end, but at most for the given duration.
    /// @return State of the run, which isn't terminal yet if timed out.
    auto wait_for(std::chrono::milliseconds timeout) -> run_state;

    /// @brief Asks the run to stop, failing it with
    ///   <code>abrupt_termination</code> unless it already stopped.
    /// @return <code>true</code> if this call stopped the run.
    auto abort() -> bool;

private:
    auto reset() noexcept -> void;

    std::shared_ptr<impl> pimpl;
    std::future<void> runner;
};

static_assert(std::is_default_constructible_v<run_handle>);
static_assert(std::is_move_constructible_v<run_handle>);
static_assert(std::is_move_assignable_v<run_handle>);
static_assert(!std::is_copy_constructible_v<run_handle>);
static_assert(!std::is_copy_assignable_v<run_handle>);

}

#endif /* run_handle_hpp */

#ifndef future_hpp
#define future_hpp

#include <chrono>
#include <future>
#include <stdexcept> // for std::runtime_error
#include <utility> // for std::move

namespace brook {

/// @brief Thrown by <code>await</code> when the awaited value isn't ready in
///   time.
/// @note This is a caller side condition. The run producing the value is
///   unaffected by it.
struct wait_timed_out: std::runtime_error
{
    explicit wait_timed_out(std::chrono::milliseconds timeout);

    [[nodiscard]] auto timeout() const noexcept -> std::chrono::milliseconds;

private:
    std::chrono::milliseconds timeout_;
};

/// @brief Eventual result of a run.
/// @note Copies share the same result. So this type can be held by any number
///   of materialized values at once.
template <class T>
struct future
{
    using value_type = T;

    future() = default;

    explicit future(std::shared_future<T> f): state{std::move(f)}
    {
        // Intentionally empty.
    }

    [[nodiscard]] auto valid() const noexcept -> bool
    {
        return state.valid();
    }

    [[nodiscard]] auto ready() const -> bool
    {
        return state.valid() && (state.wait_for(std::chrono::seconds{0}) ==
                                 std::future_status::ready);
    }

    /// @throws std::future_error if this has no shared state.
    template <class Rep, class Period>
    auto wait_for(const std::chrono::duration<Rep, Period>& timeout) const
        -> bool
    {
        check_valid();
        return state.wait_for(timeout) == std::future_status::ready;
    }

    /// @brief Blocks until the result is available.
    /// @throws The exception the run failed with, if it failed.
    /// @throws std::future_error if this has no shared state.
    auto get() const -> const T&
    {
        check_valid();
        return state.get();
    }

private:
    auto check_valid() const -> void
    {
        if (!state.valid()) {
            throw std::future_error{std::future_errc::no_state};
        }
    }

    std::shared_future<T> state;
};

/// @brief Waits on the given future for at most the given timeout.
/// @throws wait_timed_out if the result isn't available within @timeout.
/// @throws The exception the producing run failed with, if it failed.
template <class T, class Rep, class Period>
auto await(const future<T>& f,
           const std::chrono::duration<Rep, Period>& timeout) -> T
{
    if (!f.wait_for(timeout)) {
        throw wait_timed_out{
            std::chrono::duration_cast<std::chrono::milliseconds>(timeout)
        };
    }
    return f.get();
}

/// @brief Makes an already completed future.
template <class T>
auto make_ready_future(T value) -> future<T>
{
    auto p = std::promise<T>{};
    p.set_value(std::move(value));
    return future<T>{p.get_future().share()};
}

/// @brief Makes an already failed future.
template <class T>
auto make_failed_future(std::exception_ptr error) -> future<T>
{
    auto p = std::promise<T>{};
    p.set_exception(std::move(error));
    return future<T>{p.get_future().share()};
}

}

#endif /* future_hpp */

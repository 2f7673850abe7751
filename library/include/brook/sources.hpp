#ifndef sources_hpp
#define sources_hpp

#include <algorithm> // for std::max
#include <chrono>
#include <initializer_list>
#include <memory> // for std::shared_ptr, std::make_unique
#include <ratio> // for std::nano
#include <ranges>
#include <stdexcept> // for std::invalid_argument
#include <utility> // for std::move
#include <vector>

#include "brook/blueprint.hpp"
#include "brook/cancellable.hpp"
#include "brook/future.hpp"
#include "brook/graph.hpp"
#include "brook/not_used.hpp"
#include "brook/stage.hpp"
#include "brook/stage_name.hpp"

namespace brook::detail {

template <class T>
struct iterable_logic final: source_logic
{
    explicit iterable_logic(std::shared_ptr<const std::vector<T>> v):
        values{std::move(v)}
    {}

    auto run(const run_control& control, const emitter& emit) -> void override
    {
        for (auto&& value: *values) {
            if (control.stop_requested()) {
                return;
            }
            if (emit(element{value}) == demand::cancel) {
                return;
            }
        }
    }

private:
    std::shared_ptr<const std::vector<T>> values;
};

template <class T>
struct future_logic final: source_logic
{
    static constexpr auto poll_interval = std::chrono::milliseconds{10};

    explicit future_logic(future<T> f): value{std::move(f)} {}

    /// @throws The exception @value failed with, if it failed.
    auto run(const run_control& control, const emitter& emit) -> void override
    {
        while (!value.wait_for(poll_interval)) {
            if (control.stop_requested()) {
                return;
            }
        }
        if (!control.stop_requested()) {
            (void) emit(element{value.get()});
        }
    }

private:
    future<T> value;
};

/// @brief Adds @d to @t, saturating at the latest representable time.
inline auto later(std::chrono::steady_clock::time_point t,
                  std::chrono::nanoseconds d) noexcept
    -> std::chrono::steady_clock::time_point
{
    using clock = std::chrono::steady_clock;
    if (d > clock::time_point::max() - t) {
        return clock::time_point::max();
    }
    return t + std::chrono::duration_cast<clock::duration>(d);
}

/// @brief Converts the given duration to nanoseconds, saturating at
///   <code>std::chrono::nanoseconds::max()</code>.
template <class Rep, class Period>
auto saturated_nanoseconds(std::chrono::duration<Rep, Period> d)
    -> std::chrono::nanoseconds
{
    using limit = std::chrono::duration<long double, std::nano>;
    if (limit{d} >= limit{std::chrono::nanoseconds::max()}) {
        return std::chrono::nanoseconds::max();
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(d);
}

template <class T>
struct tick_logic final: source_logic
{
    /// @brief Longest single wait on the run control.
    /// @note Keeps far off deadlines away from the condition variable.
    static constexpr auto max_wait = std::chrono::hours{24};

    tick_logic(std::chrono::nanoseconds d, std::chrono::nanoseconds i, T t):
        initial_delay{d}, interval{i}, tick{std::move(t)}
    {}

    /// @note Deadlines missed while downstream was busy are skipped, not
    ///   caught up on.
    auto run(const run_control& control, const emitter& emit) -> void override
    {
        using clock = std::chrono::steady_clock;
        auto next = later(clock::now(), initial_delay);
        while (!wait_until(control, next)) {
            if (emit(element{tick}) == demand::cancel) {
                return;
            }
            const auto now = clock::now();
            if (next < now) {
                next = later(next, (now - next) / interval * interval);
            }
            next = later(next, interval);
        }
    }

private:
    /// @return <code>true</code> if the run was asked to stop.
    static auto wait_until(const run_control& control,
                           std::chrono::steady_clock::time_point when)
        -> bool
    {
        using clock = std::chrono::steady_clock;
        for (;;) {
            const auto now = clock::now();
            if (now >= when) {
                return control.stop_requested();
            }
            const auto step = (when - now > max_wait)
                ? clock::time_point{now + max_wait}
                : when;
            if (control.wait_until(step)) {
                return true;
            }
        }
    }

    std::chrono::nanoseconds initial_delay;
    std::chrono::nanoseconds interval;
    T tick;
};

template <class T>
auto make_iterable_source(stage_name name, std::vector<T> values)
    -> source<T, not_used>
{
    auto shared = std::make_shared<const std::vector<T>>(std::move(values));
    return source<T, not_used>{make_blueprint(make_source_stage(
        std::move(name), element_type_of<T>(),
        [shared](const stage_context&) {
            return stage_instance<source_logic>{
                std::make_unique<iterable_logic<T>>(shared), not_used{}
            };
        }))};
}

}

namespace brook::sources {

/// @brief Makes a source emitting the elements of the given range in order.
/// @note The elements are copied. Every run emits all of them anew.
template <std::ranges::input_range R>
    requires element_value<std::ranges::range_value_t<R>>
auto from(R&& range) -> source<std::ranges::range_value_t<R>, not_used>
{
    using value_type = std::ranges::range_value_t<R>;
    auto values = std::vector<value_type>{};
    for (auto&& value: range) {
        values.push_back(value);
    }
    return detail::make_iterable_source("iterable", std::move(values));
}

template <element_value T>
auto from(std::initializer_list<T> values) -> source<T, not_used>
{
    return detail::make_iterable_source("iterable", std::vector<T>(values));
}

/// @brief Makes a source emitting just the given element.
template <element_value T>
auto single(T value) -> source<T, not_used>
{
    return detail::make_iterable_source("single",
                                        std::vector<T>{std::move(value)});
}

/// @brief Makes a source completing without emitting anything.
template <element_value T>
auto empty() -> source<T, not_used>
{
    return detail::make_iterable_source("empty", std::vector<T>{});
}

/// @brief Makes a source emitting the value of the given future once
///   available.
/// @note Runs fail with the future's exception if the future fails.
/// @throws std::invalid_argument if @value has no shared state.
template <element_value T>
auto from_future(future<T> value) -> source<T, not_used>
{
    if (!value.valid()) {
        throw std::invalid_argument{"future has no shared state"};
    }
    return source<T, not_used>{make_blueprint(make_source_stage(
        "future", element_type_of<T>(),
        [value](const stage_context&) {
            return stage_instance<source_logic>{
                std::make_unique<detail::future_logic<T>>(value), not_used{}
            };
        }))};
}

/// @brief Makes a source emitting @value periodically.
/// @details Emits first after @initial_delay, then every @interval, until
///   cancelled through its materialized value or until downstream cancels.
///   Ticks falling due while downstream is still busy with an earlier one
///   are dropped.
/// @note Every run starts its own independent timer and materializes its
///   own <code>cancellable</code> for stopping it.
/// @note Durations beyond <code>std::chrono::nanoseconds::max()</code> are
///   taken as that, i.e. as practically never.
/// @throws std::invalid_argument if @initial_delay is negative or @interval
///   isn't positive.
template <element_value T, class Rep1, class Period1, class Rep2, class Period2>
auto tick(std::chrono::duration<Rep1, Period1> initial_delay,
          std::chrono::duration<Rep2, Period2> interval,
          T value) -> source<T, cancellable>
{
    if (initial_delay < initial_delay.zero()) {
        throw std::invalid_argument{"initial delay may not be negative"};
    }
    if (interval <= interval.zero()) {
        throw std::invalid_argument{"interval must be positive"};
    }
    const auto delay = detail::saturated_nanoseconds(initial_delay);
    const auto period = std::max(detail::saturated_nanoseconds(interval),
                                 std::chrono::nanoseconds{1});
    return source<T, cancellable>{make_blueprint(make_source_stage(
        "tick", element_type_of<T>(),
        [delay, period, value](const stage_context& context) {
            return stage_instance<source_logic>{
                std::make_unique<detail::tick_logic<T>>(delay, period, value),
                cancellable{context.control}
            };
        }))};
}

}

#endif /* sources_hpp */

#ifndef sinks_hpp
#define sinks_hpp

#include <exception> // for std::exception_ptr
#include <functional> // for std::invoke
#include <type_traits> // for std::is_invocable_r_v
#include <future> // for std::promise
#include <memory> // for std::make_unique
#include <utility> // for std::move
#include <vector>

#include "brook/blueprint.hpp"
#include "brook/future.hpp"
#include "brook/graph.hpp"
#include "brook/not_used.hpp"
#include "brook/stage.hpp"
#include "brook/stream_errors.hpp"

namespace brook::detail {

/// @brief Base of sink logic materializing a <code>future</code>.
/// @note Settles the future at most once. Later outcomes are ignored.
template <class T>
struct promising_logic: sink_logic
{
    [[nodiscard]] auto get_future() -> future<T>
    {
        return future<T>{promise.get_future().share()};
    }

    auto on_failure(std::exception_ptr error) noexcept -> void override
    {
        if (!settled) {
            settled = true;
            promise.set_exception(std::move(error));
        }
    }

protected:
    [[nodiscard]] auto is_settled() const noexcept -> bool
    {
        return settled;
    }

    auto settle(T value) -> void
    {
        if (!settled) {
            settled = true;
            promise.set_value(std::move(value));
        }
    }

private:
    std::promise<T> promise;
    bool settled{};
};

template <class In, class Acc, class Fn>
struct fold_logic final: promising_logic<Acc>
{
    fold_logic(Acc seed, Fn f): accumulated{std::move(seed)}, fn{std::move(f)}
    {}

    auto on_push(element value) -> demand override
    {
        accumulated = std::invoke(fn, std::move(accumulated),
                                  std::any_cast<const In&>(value));
        return demand::more;
    }

    auto on_complete() -> void override
    {
        this->settle(std::move(accumulated));
    }

private:
    Acc accumulated;
    Fn fn;
};

template <class T>
struct head_logic final: promising_logic<T>
{
    auto on_push(element value) -> demand override
    {
        this->settle(std::any_cast<T>(std::move(value)));
        return demand::cancel;
    }

    auto on_complete() -> void override
    {
        if (!this->is_settled()) {
            throw empty_stream_error{"head of empty stream"};
        }
    }
};

template <class T, class Fn>
struct foreach_logic final: promising_logic<done>
{
    explicit foreach_logic(Fn f): fn{std::move(f)} {}

    auto on_push(element value) -> demand override
    {
        std::invoke(fn, std::any_cast<const T&>(value));
        return demand::more;
    }

    auto on_complete() -> void override
    {
        this->settle(done{});
    }

private:
    Fn fn;
};

template <class T>
struct collect_logic final: promising_logic<std::vector<T>>
{
    auto on_push(element value) -> demand override
    {
        collected.push_back(std::any_cast<T>(std::move(value)));
        return demand::more;
    }

    auto on_complete() -> void override
    {
        this->settle(std::move(collected));
    }

private:
    std::vector<T> collected;
};

struct ignore_logic final: sink_logic
{
    auto on_push(element) -> demand override
    {
        return demand::more;
    }

    auto on_complete() -> void override
    {
        // Intentionally empty.
    }

    auto on_failure(std::exception_ptr) noexcept -> void override
    {
        // Intentionally empty.
    }
};

/// @brief Makes the stage instance of a sink whose materialized value is
///   the future of the given promising logic.
template <class Logic>
auto make_promising_instance(std::unique_ptr<Logic> logic)
    -> stage_instance<sink_logic>
{
    auto value = logic->get_future();
    return stage_instance<sink_logic>{std::move(logic), std::move(value)};
}

}

namespace brook::sinks {

/// @brief Makes a sink folding every element into an accumulated value.
/// @details Every run starts from its own copy of @seed and @fn, calling
///   <code>fn(accumulated, element)</code> for every element.
/// @return Sink materializing the future of the accumulated value at
///   completion.
template <element_value In, element_value Acc, class Fn>
    requires std::copy_constructible<Fn> &&
        std::is_invocable_r_v<Acc, Fn&, Acc, const In&>
auto fold(Acc seed, Fn fn) -> sink<In, future<Acc>>
{
    return sink<In, future<Acc>>{make_blueprint(make_sink_stage(
        "fold", element_type_of<In>(),
        [seed, fn](const stage_context&) {
            return detail::make_promising_instance(
                std::make_unique<detail::fold_logic<In, Acc, Fn>>(seed, fn)
            );
        }))};
}

/// @brief Makes a sink materializing the future of the first element.
/// @note The future fails with <code>empty_stream_error</code> if the
///   stream completes without elements.
template <element_value T>
auto head() -> sink<T, future<T>>
{
    return sink<T, future<T>>{make_blueprint(make_sink_stage(
        "head", element_type_of<T>(),
        [](const stage_context&) {
            return detail::make_promising_instance(
                std::make_unique<detail::head_logic<T>>()
            );
        }))};
}

/// @brief Makes a sink consuming elements without doing anything with them.
template <element_value T>
auto ignore() -> sink<T, not_used>
{
    return sink<T, not_used>{make_blueprint(make_sink_stage(
        "ignore", element_type_of<T>(),
        [](const stage_context&) {
            return stage_instance<sink_logic>{
                std::make_unique<detail::ignore_logic>(), not_used{}
            };
        }))};
}

/// @brief Makes a sink calling @fn for every element.
template <element_value T, class Fn>
    requires std::copy_constructible<Fn> && std::invocable<Fn&, const T&>
auto foreach(Fn fn) -> sink<T, future<done>>
{
    return sink<T, future<done>>{make_blueprint(make_sink_stage(
        "foreach", element_type_of<T>(),
        [fn](const stage_context&) {
            return detail::make_promising_instance(
                std::make_unique<detail::foreach_logic<T, Fn>>(fn)
            );
        }))};
}

/// @brief Makes a sink collecting all elements in order.
template <element_value T>
auto collect() -> sink<T, future<std::vector<T>>>
{
    return sink<T, future<std::vector<T>>>{make_blueprint(make_sink_stage(
        "collect", element_type_of<T>(),
        [](const stage_context&) {
            return detail::make_promising_instance(
                std::make_unique<detail::collect_logic<T>>()
            );
        }))};
}

}

#endif /* sinks_hpp */

#ifndef graph_hpp
#define graph_hpp

#include <any>
#include <concepts> // for std::invocable, std::copy_constructible
#include <cstddef> // for std::size_t
#include <type_traits> // for std::invoke_result_t
#include <utility> // for std::move

#include "brook/blueprint.hpp"
#include "brook/element.hpp"
#include "brook/flow_stages.hpp"
#include "brook/keep.hpp"
#include "brook/materializer.hpp"
#include "brook/not_used.hpp"
#include "brook/stage_name.hpp"

namespace brook {

/// @brief Typed face of the graph builder.
/// @details The types here wrap a <code>blueprint</code> each, tracking the
///   element types of its open ports and the type of its materialized value.
///   Connecting ports of different element types is thereby a compile time
///   error instead of an <code>invalid_connection</code> exception.
/// @note Like blueprints, these are immutable values. Every operation
///   returns a new graph and leaves the one it's called on as it was.

template <element_value Out, class Mat> struct source;
template <element_value In, element_value Out, class Mat> struct flow;
template <element_value In, class Mat> struct sink;
template <class Mat> struct runnable_graph;

template <class F, class T>
concept mapper = std::copy_constructible<F> && std::invocable<F&, const T&> &&
    element_value<std::invoke_result_t<F&, const T&>>;

template <class F, class T>
concept element_predicate = std::copy_constructible<F> &&
    std::predicate<F&, const T&>;

template <class C, class L, class R>
concept combiner_for = std::copy_constructible<C> &&
    std::invocable<const C&, L, R>;

/// @brief Connects two typed graphs' blueprints.
template <class L, class R, class Combine>
auto connect_typed(const blueprint& upstream, const blueprint& downstream,
                   Combine how) -> blueprint
{
    return connect(upstream, downstream,
                   make_combiner<L, R>(std::move(how)));
}

/// @brief Appends the given stage, keeping the materialized value of
///   @upstream.
auto append(const blueprint& upstream, stage value) -> blueprint;

/// @brief Closed graph, ready to be materialized.
template <class Mat>
struct runnable_graph
{
    using mat_type = Mat;

    explicit runnable_graph(blueprint value): shape_{std::move(value)}
    {
        // Intentionally empty.
    }

    [[nodiscard]] auto shape() const noexcept -> const blueprint&
    {
        return shape_;
    }

    auto named(stage_name name) const -> runnable_graph
    {
        return runnable_graph{brook::named(shape_, std::move(name))};
    }

    /// @brief Materializes this, leaving the run to the materializer.
    /// @return Materialized value of the run.
    /// @see materializer::adopt.
    auto run(materializer& m) const -> Mat;

private:
    blueprint shape_;
};

/// @brief Materializes the given graph.
/// @return Handle to the run and its materialized value.
template <class Mat>
auto materialize(const runnable_graph<Mat>& graph, materializer& m)
    -> materialized<Mat>
{
    auto result = m.run(graph.shape());
    auto value = std::any_cast<Mat>(std::move(result.value));
    return {std::move(result.handle), std::move(value)};
}

template <class Mat>
auto runnable_graph<Mat>::run(materializer& m) const -> Mat
{
    auto result = materialize(*this, m);
    m.adopt(std::move(result.handle));
    return std::move(result.value);
}

/// @brief Graph with one open outlet producing elements of type @Out.
template <element_value Out, class Mat>
struct source
{
    using out_type = Out;
    using mat_type = Mat;

    explicit source(blueprint value): shape_{std::move(value)}
    {
        // Intentionally empty.
    }

    [[nodiscard]] auto shape() const noexcept -> const blueprint&
    {
        return shape_;
    }

    /// @brief Gets a copy of this source renamed to @name.
    /// @note The name carries over into graphs built from this source, unless
    ///   whatever it's connected to is named too.
    auto named(stage_name name) const -> source
    {
        return source{brook::named(shape_, std::move(name))};
    }

    template <mapper<Out> Fn>
    auto map(Fn fn) const -> source<std::invoke_result_t<Fn&, const Out&>, Mat>
    {
        using result_type = std::invoke_result_t<Fn&, const Out&>;
        return source<result_type, Mat>{
            append(shape_, detail::make_map_stage<Out>(std::move(fn)))
        };
    }

    template <element_predicate<Out> Pred>
    auto filter(Pred pred) const -> source
    {
        return source{
            append(shape_, detail::make_filter_stage<Out>(std::move(pred)))
        };
    }

    auto take(std::size_t n) const -> source
    {
        return source{append(shape_, detail::make_take_stage<Out>(n))};
    }

    /// @brief Attaches the given flow.
    /// @note Keeps this source's materialized value by default.
    template <element_value T, class M, class Combine = keep::left_t>
        requires combiner_for<Combine, Mat, M>
    auto via(const flow<Out, T, M>& f, Combine how = {}) const
        -> source<T, combined_t<Combine, Mat, M>>
    {
        return source<T, combined_t<Combine, Mat, M>>{
            connect_typed<Mat, M>(shape_, f.shape(), std::move(how))
        };
    }

    /// @brief Attaches the given sink.
    /// @note Keeps the sink's materialized value by default, so any value
    ///   this source materializes is dropped. Use <code>keep::left</code>
    ///   or <code>keep::both</code> to hold on to it.
    template <class M, class Combine = keep::right_t>
        requires combiner_for<Combine, Mat, M>
    auto to(const sink<Out, M>& s, Combine how = {}) const
        -> runnable_graph<combined_t<Combine, Mat, M>>
    {
        return runnable_graph<combined_t<Combine, Mat, M>>{
            connect_typed<Mat, M>(shape_, s.shape(), std::move(how))
        };
    }

    /// @brief Attaches the given sink and runs the result.
    /// @return The sink's materialized value.
    template <class M>
    auto run_with(const sink<Out, M>& s, materializer& m) const -> M
    {
        return to(s, keep::right).run(m);
    }

private:
    blueprint shape_;
};

/// @brief Graph with an open inlet consuming @In and an open outlet
///   producing @Out.
template <element_value In, element_value Out, class Mat>
struct flow
{
    using in_type = In;
    using out_type = Out;
    using mat_type = Mat;

    explicit flow(blueprint value): shape_{std::move(value)}
    {
        // Intentionally empty.
    }

    [[nodiscard]] auto shape() const noexcept -> const blueprint&
    {
        return shape_;
    }

    auto named(stage_name name) const -> flow
    {
        return flow{brook::named(shape_, std::move(name))};
    }

    template <mapper<Out> Fn>
    auto map(Fn fn) const
        -> flow<In, std::invoke_result_t<Fn&, const Out&>, Mat>
    {
        using result_type = std::invoke_result_t<Fn&, const Out&>;
        return flow<In, result_type, Mat>{
            append(shape_, detail::make_map_stage<Out>(std::move(fn)))
        };
    }

    template <element_predicate<Out> Pred>
    auto filter(Pred pred) const -> flow
    {
        return flow{
            append(shape_, detail::make_filter_stage<Out>(std::move(pred)))
        };
    }

    auto take(std::size_t n) const -> flow
    {
        return flow{append(shape_, detail::make_take_stage<Out>(n))};
    }

    template <element_value T, class M, class Combine = keep::left_t>
        requires combiner_for<Combine, Mat, M>
    auto via(const flow<Out, T, M>& f, Combine how = {}) const
        -> flow<In, T, combined_t<Combine, Mat, M>>
    {
        return flow<In, T, combined_t<Combine, Mat, M>>{
            connect_typed<Mat, M>(shape_, f.shape(), std::move(how))
        };
    }

    /// @brief Attaches the given sink, making a new sink.
    /// @note Keeps the attached sink's materialized value by default.
    template <class M, class Combine = keep::right_t>
        requires combiner_for<Combine, Mat, M>
    auto to(const sink<Out, M>& s, Combine how = {}) const
        -> sink<In, combined_t<Combine, Mat, M>>
    {
        return sink<In, combined_t<Combine, Mat, M>>{
            connect_typed<Mat, M>(shape_, s.shape(), std::move(how))
        };
    }

private:
    blueprint shape_;
};

/// @brief Graph with one open inlet consuming elements of type @In.
template <element_value In, class Mat>
struct sink
{
    using in_type = In;
    using mat_type = Mat;

    explicit sink(blueprint value): shape_{std::move(value)}
    {
        // Intentionally empty.
    }

    [[nodiscard]] auto shape() const noexcept -> const blueprint&
    {
        return shape_;
    }

    auto named(stage_name name) const -> sink
    {
        return sink{brook::named(shape_, std::move(name))};
    }

    /// @brief Attaches the given source and runs the result.
    /// @return The source's materialized value.
    template <class M>
    auto run_with(const source<In, M>& s, materializer& m) const -> M
    {
        return s.to(*this, keep::left).run(m);
    }

private:
    blueprint shape_;
};

}

#endif /* graph_hpp */

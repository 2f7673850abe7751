#ifndef flow_stages_hpp
#define flow_stages_hpp

#include <cstddef> // for std::size_t
#include <functional> // for std::invoke
#include <memory> // for std::make_unique
#include <type_traits> // for std::invoke_result_t
#include <utility> // for std::move

#include "brook/element.hpp"
#include "brook/not_used.hpp"
#include "brook/stage.hpp"
#include "brook/stage_logic.hpp"

namespace brook::detail {

template <class In, class Fn>
struct map_logic final: flow_logic
{
    explicit map_logic(Fn f): fn{std::move(f)} {}

    auto on_push(element value, const emitter& emit) -> demand override
    {
        return emit(element{std::invoke(fn, std::any_cast<const In&>(value))});
    }

private:
    Fn fn;
};

template <class In, class Pred>
struct filter_logic final: flow_logic
{
    explicit filter_logic(Pred p): pred{std::move(p)} {}

    auto on_push(element value, const emitter& emit) -> demand override
    {
        if (!std::invoke(pred, std::any_cast<const In&>(value))) {
            return demand::more;
        }
        return emit(std::move(value));
    }

private:
    Pred pred;
};

struct take_logic final: flow_logic
{
    explicit take_logic(std::size_t n): limit{n} {}

    auto on_push(element value, const emitter& emit) -> demand override
    {
        if (taken >= limit) {
            return demand::cancel;
        }
        ++taken;
        const auto wanted = emit(std::move(value));
        return (taken >= limit)? demand::cancel: wanted;
    }

private:
    std::size_t limit{};
    std::size_t taken{};
};

struct identity_logic final: flow_logic
{
    auto on_push(element value, const emitter& emit) -> demand override
    {
        return emit(std::move(value));
    }
};

/// @brief Makes a flow stage whose every run gets its own copy of @fn.
template <class In, class Fn>
auto make_map_stage(Fn fn) -> stage
{
    using out_type = std::invoke_result_t<Fn&, const In&>;
    return make_flow_stage("map", element_type_of<In>(),
                           element_type_of<out_type>(),
                           [fn = std::move(fn)](const stage_context&) {
        return stage_instance<flow_logic>{
            std::make_unique<map_logic<In, Fn>>(fn), not_used{}
        };
    });
}

template <class In, class Pred>
auto make_filter_stage(Pred pred) -> stage
{
    return make_flow_stage("filter", element_type_of<In>(),
                           element_type_of<In>(),
                           [pred = std::move(pred)](const stage_context&) {
        return stage_instance<flow_logic>{
            std::make_unique<filter_logic<In, Pred>>(pred), not_used{}
        };
    });
}

template <class In>
auto make_take_stage(std::size_t n) -> stage
{
    return make_flow_stage("take", element_type_of<In>(),
                           element_type_of<In>(),
                           [n](const stage_context&) {
        return stage_instance<flow_logic>{
            std::make_unique<take_logic>(n), not_used{}
        };
    });
}

template <class In>
auto make_identity_stage() -> stage
{
    return make_flow_stage("identity", element_type_of<In>(),
                           element_type_of<In>(),
                           [](const stage_context&) {
        return stage_instance<flow_logic>{
            std::make_unique<identity_logic>(), not_used{}
        };
    });
}

}

#endif /* flow_stages_hpp */

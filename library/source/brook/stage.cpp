#include <stdexcept> // for std::invalid_argument
#include <utility> // for std::move

#include "brook/stage.hpp"
#include "brook/utility.hpp"

namespace brook {

namespace {

template <class Factory>
auto check_factory(const stage_name& name, Factory factory) -> Factory
{
    if (!factory) {
        throw std::invalid_argument{"stage " + name.get() +
                                    " has no factory"};
    }
    return factory;
}

}

auto operator<<(std::ostream& os, run_id value) -> std::ostream&
{
    os << to_underlying(value);
    return os;
}

auto operator<<(std::ostream& os, stage_role value) -> std::ostream&
{
    switch (value) {
    case stage_role::source:
        os << "source";
        return os;
    case stage_role::flow:
        os << "flow";
        return os;
    case stage_role::sink:
        os << "sink";
        return os;
    }
    os << "stage_role(" << to_underlying(value) << ")";
    return os;
}

auto role_of(const stage& value) -> stage_role
{
    return std::visit(detail::overloaded{
        [](const source_factory&) { return stage_role::source; },
        [](const flow_factory&) { return stage_role::flow; },
        [](const sink_factory&) { return stage_role::sink; },
    }, value.factory);
}

auto make_source_stage(stage_name name, element_type outlet,
                       source_factory factory)
    -> stage
{
    auto checked = check_factory(name, std::move(factory));
    return stage{std::move(name), {}, outlet, std::move(checked)};
}

auto make_flow_stage(stage_name name, element_type inlet,
                     element_type outlet, flow_factory factory)
    -> stage
{
    auto checked = check_factory(name, std::move(factory));
    return stage{std::move(name), inlet, outlet, std::move(checked)};
}

auto make_sink_stage(stage_name name, element_type inlet,
                     sink_factory factory)
    -> stage
{
    auto checked = check_factory(name, std::move(factory));
    return stage{std::move(name), inlet, {}, std::move(checked)};
}

auto operator<<(std::ostream& os, const stage& value) -> std::ostream&
{
    os << "stage{";
    os << ".name=" << value.name;
    os << ",.role=" << role_of(value);
    if (value.inlet) {
        os << ",.inlet=" << value.inlet;
    }
    if (value.outlet) {
        os << ",.outlet=" << value.outlet;
    }
    os << "}";
    return os;
}

}

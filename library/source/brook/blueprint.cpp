#include <sstream> // for std::ostringstream
#include <stdexcept> // for std::out_of_range, std::invalid_argument
#include <string>
#include <utility> // for std::move

#include "brook/blueprint.hpp"
#include "brook/utility.hpp"

namespace brook {

namespace {

auto make_leaf(std::size_t index) -> mat_tree
{
    return std::make_shared<const mat_node>(mat_node{mat_leaf{index}});
}

auto print(std::ostream& os, const mat_tree& tree, std::size_t offset)
    -> void
{
    if (!tree) {
        os << "none";
        return;
    }
    std::visit(detail::overloaded{
        [&os,offset](const mat_leaf& leaf) {
            os << (offset + leaf.index);
        },
        [&os,offset](const mat_combination& combo) {
            os << combo.how << "(";
            print(os, combo.lhs, offset);
            os << ",";
            print(os, combo.rhs, offset + combo.rhs_offset);
            os << ")";
        },
    }, tree->info);
}

auto pretty_print(std::ostream& os, const mat_tree& tree,
                  std::size_t offset, const std::string& indent) -> void
{
    if (!tree) {
        os << indent << "none\n";
        return;
    }
    std::visit(detail::overloaded{
        [&](const mat_leaf& leaf) {
            os << indent << "stage " << (offset + leaf.index) << "\n";
        },
        [&](const mat_combination& combo) {
            os << indent << combo.how << "\n";
            pretty_print(os, combo.lhs, offset, indent + "  ");
            pretty_print(os, combo.rhs, offset + combo.rhs_offset,
                         indent + "  ");
        },
    }, tree->info);
}

auto describe_mismatch(const port_type& up, const port_type& down)
    -> std::string
{
    std::ostringstream os;
    if (!up) {
        os << "upstream has no open outlet";
    }
    else if (!down) {
        os << "downstream has no open inlet";
    }
    else {
        os << "element type mismatch: upstream produces " << up;
        os << ", downstream consumes " << down;
    }
    return os.str();
}

}

auto operator<<(std::ostream& os, const mat_tree& value) -> std::ostream&
{
    print(os, value, 0u);
    return os;
}

auto evaluate(const mat_tree& tree, std::span<std::any> values) -> std::any
{
    if (!tree) {
        throw std::invalid_argument{"no materialized value tree"};
    }
    return std::visit(detail::overloaded{
        [values](const mat_leaf& leaf) -> std::any {
            if (leaf.index >= size(values)) {
                throw std::out_of_range{
                    "materialized value tree refers to stage " +
                    std::to_string(leaf.index) + " of " +
                    std::to_string(size(values))
                };
            }
            return values[leaf.index];
        },
        [values](const mat_combination& combo) -> std::any {
            if (combo.rhs_offset > size(values)) {
                throw std::out_of_range{"combination offset beyond stages"};
            }
            return combine(combo.how,
                           evaluate(combo.lhs,
                                    values.first(combo.rhs_offset)),
                           evaluate(combo.rhs,
                                    values.subspan(combo.rhs_offset)));
        },
    }, tree->info);
}

auto operator<<(std::ostream& os, const blueprint& value) -> std::ostream&
{
    os << "blueprint{";
    if (!value.name.get().empty()) {
        os << ".name=" << value.name << ",";
    }
    os << ".stages={";
    auto prefix = "";
    for (auto&& s: value.stages) {
        os << prefix << s->name;
        prefix = ",";
    }
    os << "}";
    os << ",.inlet=" << value.inlet;
    os << ",.outlet=" << value.outlet;
    os << ",.materialized=" << value.materialized;
    os << "}";
    return os;
}

auto pretty_print(std::ostream& os, const blueprint& value) -> void
{
    os << "{\n";
    if (!value.name.get().empty()) {
        os << "  .name=" << value.name << ",\n";
    }
    os << "  .stages={\n";
    auto index = std::size_t{0};
    for (auto&& s: value.stages) {
        os << "    " << index << ": " << *s << ",\n";
        ++index;
    }
    os << "  },\n";
    os << "  .inlet=" << value.inlet << ",\n";
    os << "  .outlet=" << value.outlet << ",\n";
    os << "  .materialized={\n";
    pretty_print(os, value.materialized, 0u, "    ");
    os << "  }\n";
    os << "}\n";
}

auto make_blueprint(stage value) -> blueprint
{
    auto result = blueprint{};
    result.inlet = value.inlet;
    result.outlet = value.outlet;
    result.stages.push_back(std::make_shared<const stage>(std::move(value)));
    result.materialized = make_leaf(0u);
    return result;
}

auto connect(const blueprint& upstream, const blueprint& downstream,
             const combiner& how)
    -> blueprint
{
    if (!upstream.outlet || !downstream.inlet ||
        (*upstream.outlet != *downstream.inlet)) {
        throw invalid_connection{
            upstream.outlet, downstream.inlet,
            describe_mismatch(upstream.outlet, downstream.inlet)
        };
    }
    auto result = blueprint{};
    result.stages.reserve(size(upstream.stages) + size(downstream.stages));
    result.stages.insert(end(result.stages),
                         begin(upstream.stages), end(upstream.stages));
    result.stages.insert(end(result.stages),
                         begin(downstream.stages), end(downstream.stages));
    result.inlet = upstream.inlet;
    result.outlet = downstream.outlet;
    if (downstream.name.get().empty()) {
        result.name = upstream.name;
    }
    else if (upstream.name.get().empty()) {
        result.name = downstream.name;
    }
    result.materialized = std::make_shared<const mat_node>(mat_node{
        mat_combination{
            upstream.materialized,
            downstream.materialized,
            size(upstream.stages),
            how
        }
    });
    return result;
}

auto named(const blueprint& value, stage_name name) -> blueprint
{
    auto result = value;
    result.name = std::move(name);
    return result;
}

auto is_runnable(const blueprint& value) noexcept -> bool
{
    return !value.inlet && !value.outlet && !empty(value.stages);
}

}

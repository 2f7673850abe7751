#ifndef blueprint_hpp
#define blueprint_hpp

#include <any>
#include <concepts> // for std::copyable.
#include <cstddef> // for std::size_t
#include <memory> // for std::shared_ptr
#include <ostream>
#include <span>
#include <variant>
#include <vector>

#include "brook/combiner.hpp"
#include "brook/element.hpp"
#include "brook/invalid_connection.hpp"
#include "brook/stage.hpp"
#include "brook/stage_name.hpp"

namespace brook {

struct mat_node;

/// @brief Persistent tree describing how a blueprint's materialized value
///   is computed from those of its stages.
using mat_tree = std::shared_ptr<const mat_node>;

/// @brief Takes the materialized value of the stage at the given index.
struct mat_leaf
{
    std::size_t index{};
};

/// @brief Combines the values of two subtrees.
/// @note Indices within @rhs are relative to @rhs_offset.
struct mat_combination
{
    mat_tree lhs;
    mat_tree rhs;
    std::size_t rhs_offset{};
    combiner how;
};

struct mat_node
{
    std::variant<mat_leaf, mat_combination> info;
};

auto operator<<(std::ostream& os, const mat_tree& value) -> std::ostream&;

/// @brief Computes a materialized value from the given stage values.
/// @throws std::out_of_range if the tree refers to a stage beyond @values.
/// @throws std::invalid_argument if @tree is null.
auto evaluate(const mat_tree& tree, std::span<std::any> values) -> std::any;

/// @brief Immutable description of a data pipeline.
/// @note Blueprints are values. Deriving a new blueprint from one, like
///   through <code>connect</code>, shares the unchanged stage descriptions
///   and never alters the blueprint derived from.
/// @note A blueprint is runnable once neither of its ends is open anymore.
/// @see connect, materializer.
struct blueprint
{
    /// @brief Name used for runs of this in diagnostics. Empty for none.
    stage_name name;

    /// @brief Stages ordered from the upstream end to the downstream end.
    std::vector<std::shared_ptr<const stage>> stages;

    /// @brief Open inlet, if any.
    port_type inlet;

    /// @brief Open outlet, if any.
    port_type outlet;

    mat_tree materialized;
};

static_assert(std::copyable<blueprint>);

auto operator<<(std::ostream& os, const blueprint& value) -> std::ostream&;

auto pretty_print(std::ostream& os, const blueprint& value) -> void;

/// @brief Makes a blueprint consisting of just the given stage.
/// @note The blueprint's materialized value is that of the stage.
auto make_blueprint(stage value) -> blueprint;

/// @brief Connects the outlet of @upstream to the inlet of @downstream.
/// @param[in] how How the materialized values of both sides combine into the
///   materialized value of the result. Keeps the downstream side's value
///   by default, dropping whatever the upstream side materializes.
/// @note The result has the name of whichever side has one. It's unnamed if
///   both sides are named or neither is.
/// @throws invalid_connection if @upstream has no open outlet, @downstream
///   has no open inlet, or the element types of these ports differ.
auto connect(const blueprint& upstream, const blueprint& downstream,
             const combiner& how = combiners::keep_right())
    -> blueprint;

/// @brief Gets a copy of the given blueprint renamed to @name.
auto named(const blueprint& value, stage_name name) -> blueprint;

/// @brief Whether the given blueprint is closed, i.e. can be materialized.
[[nodiscard]] auto is_runnable(const blueprint& value) noexcept -> bool;

}

#endif /* blueprint_hpp */

#ifndef stage_hpp
#define stage_hpp

#include <any>
#include <concepts> // for std::copyable.
#include <cstdint> // for std::uint64_t
#include <functional> // for std::function
#include <memory> // for std::unique_ptr, std::shared_ptr
#include <ostream>
#include <variant>

#include "brook/element.hpp"
#include "brook/run_control.hpp"
#include "brook/stage_logic.hpp"
#include "brook/stage_name.hpp"

namespace brook {

/// @brief Run identifier, unique per materializer.
enum class run_id: std::uint64_t;

constexpr auto no_run_id = run_id{0u};

auto operator<<(std::ostream& os, run_id value) -> std::ostream&;

enum class stage_role: int { source, flow, sink };

auto operator<<(std::ostream& os, stage_role value) -> std::ostream&;

/// @brief What a stage factory gets to know about the run it's making
///   logic for.
struct stage_context
{
    run_id id{no_run_id};

    /// @brief Stop signal of the run.
    /// @note Stages offering cancellation hand this out within a
    ///   <code>cancellable</code>.
    std::shared_ptr<run_control> control;
};

/// @brief Fresh logic for one stage of one run, plus the stage's
///   materialized value for that run.
template <class Logic>
struct stage_instance
{
    std::unique_ptr<Logic> logic;
    std::any value;
};

using source_factory =
    std::function<stage_instance<source_logic>(const stage_context&)>;
using flow_factory =
    std::function<stage_instance<flow_logic>(const stage_context&)>;
using sink_factory =
    std::function<stage_instance<sink_logic>(const stage_context&)>;

/// @brief Immutable description of one processing step.
/// @note Materializing calls the factory anew for every run. That's what
///   keeps runs from sharing any stage state.
struct stage
{
    stage_name name;

    /// @brief Element type consumed. Closed for sources.
    port_type inlet;

    /// @brief Element type produced. Closed for sinks.
    port_type outlet;

    std::variant<source_factory, flow_factory, sink_factory> factory;
};

static_assert(std::copyable<stage>);

[[nodiscard]] auto role_of(const stage& value) -> stage_role;

/// @brief Makes a source stage description.
/// @throws std::invalid_argument if @factory is empty.
auto make_source_stage(stage_name name, element_type outlet,
                       source_factory factory)
    -> stage;

/// @brief Makes a flow stage description.
/// @throws std::invalid_argument if @factory is empty.
auto make_flow_stage(stage_name name, element_type inlet,
                     element_type outlet, flow_factory factory)
    -> stage;

/// @brief Makes a sink stage description.
/// @throws std::invalid_argument if @factory is empty.
auto make_sink_stage(stage_name name, element_type inlet,
                     sink_factory factory)
    -> stage;

auto operator<<(std::ostream& os, const stage& value) -> std::ostream&;

}

#endif /* stage_hpp */

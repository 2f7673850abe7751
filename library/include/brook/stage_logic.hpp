#ifndef stage_logic_hpp
#define stage_logic_hpp

#include <exception> // for std::exception_ptr
#include <functional> // for std::function
#include <ostream>

#include "brook/element.hpp"
#include "brook/run_control.hpp"

namespace brook {

/// @brief Whether the downstream side of a stage wants further elements.
enum class demand: int { more, cancel };

auto operator<<(std::ostream& os, demand value) -> std::ostream&;

/// @brief Pushes an element to the next stage of the run.
using emitter = std::function<demand(element)>;

/// @brief Per run logic of a source stage.
/// @note Instances are made fresh for every run and only ever used from that
///   run's thread of execution.
struct source_logic
{
    virtual ~source_logic();

    /// @brief Produces elements until exhausted, until the run is asked to
    ///   stop, or until @emit returns <code>demand::cancel</code>.
    /// @throws Any exception, failing the run.
    virtual auto run(const run_control& control, const emitter& emit)
        -> void = 0;
};

/// @brief Per run logic of a flow stage.
struct flow_logic
{
    virtual ~flow_logic();

    /// @brief Handles one element from upstream.
    /// @return <code>demand::cancel</code> once no more input is wanted.
    virtual auto on_push(element value, const emitter& emit) -> demand = 0;

    /// @brief Upstream finished. Buffered elements may still be emitted.
    virtual auto on_complete(const emitter& emit) -> void;
};

/// @brief Per run logic of a sink stage.
struct sink_logic
{
    virtual ~sink_logic();

    virtual auto on_push(element value) -> demand = 0;
    virtual auto on_complete() -> void = 0;

    /// @brief The run failed.
    /// @note May be called after <code>on_complete</code> if completing failed.
    virtual auto on_failure(std::exception_ptr error) noexcept -> void = 0;
};

}

#endif /* stage_logic_hpp */

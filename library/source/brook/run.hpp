#ifndef run_hpp
#define run_hpp

#include <memory> // for std::unique_ptr, std::shared_ptr
#include <mutex>
#include <string>
#include <vector>

#include "brook/run_control.hpp"
#include "brook/run_handle.hpp"
#include "brook/run_state.hpp"
#include "brook/stage_logic.hpp"

#include "diagnostics.hpp"

namespace brook {

struct run_handle::impl
{
    impl(run_id i, std::string n, std::shared_ptr<run_control> c,
         std::shared_ptr<detail::diagnostics> d);

    const run_id id;
    const std::string name;
    const std::shared_ptr<run_control> control;
    const std::shared_ptr<detail::diagnostics> diags;

    std::unique_ptr<source_logic> source;
    std::vector<std::unique_ptr<flow_logic>> flows;
    std::unique_ptr<sink_logic> sink;

    mutable std::mutex mutex;
    run_state state{run_created{}};
};

/// @brief Logs a line prefixed by the name of the given run.
auto log(const run_handle::impl& run, const std::string& what) -> void;

/// @brief Executes the given run till its end.
/// @note This is the body of every run's thread of execution. It doesn't
///   throw. Failures end up in the run's state and in its sink.
auto execute(run_handle::impl& run) noexcept -> void;

}

#endif /* run_hpp */

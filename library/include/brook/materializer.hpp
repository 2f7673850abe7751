#ifndef materializer_hpp
#define materializer_hpp

#include <any>
#include <atomic>
#include <cstddef> // for std::size_t
#include <cstdint> // for std::uint64_t
#include <memory> // for std::shared_ptr
#include <mutex>
#include <ostream>
#include <stdexcept> // for std::invalid_argument, std::logic_error
#include <string>
#include <vector>

#include "brook/blueprint.hpp"
#include "brook/run_handle.hpp"
#include "brook/stage_name.hpp"

namespace brook {

namespace detail {
struct diagnostics;
}

/// @brief Options for <code>materializer</code>.
/// @see materializer.
struct materializer_settings
{
    static constexpr auto default_log_lifecycle = true;

    /// @brief Prefix of the names of runs in diagnostics.
    stage_name name{"brook"};

    /// @brief Whether to write run life cycle events to the diagnostics
    ///   stream.
    bool log_lifecycle{default_log_lifecycle};
};

/// @brief Thrown for attempts to materialize a blueprint that isn't
///   runnable.
struct invalid_blueprint: std::invalid_argument
{
    using std::invalid_argument::invalid_argument;
};

/// @brief Thrown for attempts to materialize with a shut down materializer.
struct materializer_closed: std::logic_error
{
    using std::logic_error::logic_error;
};

/// @brief Result of materializing.
template <class Mat>
struct materialized
{
    /// @brief The run that was started.
    run_handle handle;

    /// @brief Materialized value of the run.
    Mat value;
};

/// @brief Turns runnable blueprints into runs.
/// @note Every call to <code>run</code> makes fresh stage instances and
///   starts an independent, asynchronously executing run. Running the same
///   blueprint any number of times is fine.
/// @note This type is neither copyable nor movable.
struct materializer
{
    /// @param[out] diags Diagnostics about runs. Must outlive this instance.
    explicit materializer(std::ostream& diags,
                          materializer_settings settings = {});

    /// @brief Shuts down this instance.
    /// @see shutdown.
    ~materializer();

    materializer(const materializer& other) = delete;
    auto operator=(const materializer& other) -> materializer& = delete;

    /// @brief Materializes the given blueprint.
    /// @return Handle to the started run plus its materialized value.
    /// @throws invalid_blueprint if @value isn't runnable.
    /// @throws materializer_closed if this was shut down.
    /// @throws Whatever a stage factory throws. No run is started then.
    auto run(const blueprint& value) -> materialized<std::any>;

    /// @brief Takes over ownership of the given run.
    /// @note The run then continues until it ends on its own, or until this
    ///   materializer shuts down. Ended runs are released as runs get
    ///   adopted. Runs adopted after shutdown are aborted right away.
    auto adopt(run_handle handle) -> void;

    /// @brief Aborts all adopted runs and waits for them to end.
    /// @note Further attempts to <code>run</code> throw.
    auto shutdown() -> void;

    [[nodiscard]] auto is_shutdown() const -> bool;

    /// @brief Number of adopted runs that haven't ended yet.
    [[nodiscard]] auto active_runs() const -> std::size_t;

    [[nodiscard]] auto settings() const noexcept
        -> const materializer_settings&;

private:
    auto log(const std::string& what) const -> void;

    const materializer_settings settings_;
    const std::shared_ptr<detail::diagnostics> diags_;
    std::atomic<std::uint64_t> last_id{0u};
    mutable std::mutex mutex;
    bool closed{false};
    std::vector<run_handle> adopted;
};

}

#endif /* materializer_hpp */

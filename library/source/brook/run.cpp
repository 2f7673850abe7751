#include <iostream> // for std::cerr
#include <sstream> // for std::ostringstream
#include <utility> // for std::move, std::exchange

#include "brook/stream_errors.hpp"

#include "run.hpp"

namespace brook {

namespace {

auto set_state(run_handle::impl& run, run_state state) -> void
{
    const std::lock_guard lock{run.mutex};
    run.state = std::move(state);
}

/// @brief Links up the emitters of the given run.
/// @note Emitters refer to one another through @emitters, which therefore
///   mustn't be resized or moved while they're in use.
auto link_emitters(run_handle::impl& run, std::vector<emitter>& emitters)
    -> void
{
    const auto n = size(run.flows);
    emitters.resize(n + 1u);
    emitters[n] = [&run](element value) {
        return run.sink->on_push(std::move(value));
    };
    for (auto i = n; i > 0u; --i) {
        emitters[i - 1u] = [&run, &emitters, i](element value) {
            return run.flows[i - 1u]->on_push(std::move(value), emitters[i]);
        };
    }
}

auto release(run_handle::impl& run) -> void
{
    run.source.reset();
    run.flows.clear();
    run.sink.reset();
}

}

run_handle::impl::impl(run_id i, std::string n,
                       std::shared_ptr<run_control> c,
                       std::shared_ptr<detail::diagnostics> d):
    id{i}, name{std::move(n)}, control{std::move(c)}, diags{std::move(d)}
{
    // Intentionally empty.
}

auto log(const run_handle::impl& run, const std::string& what) -> void
{
    if (run.diags) {
        run.diags->write(run.name + ": " + what);
    }
}

auto execute(run_handle::impl& run) noexcept -> void
{
    set_state(run, run_running{});
    log(run, "started");
    auto result = run_state{run_completed{}};
    try {
        auto emitters = std::vector<emitter>{};
        link_emitters(run, emitters);
        run.source->run(*run.control, emitters.front());
        if (run.control->reason() == stop_reason::aborted) {
            throw abrupt_termination{run.name + " aborted"};
        }
        for (auto i = std::size_t{0}; i < size(run.flows); ++i) {
            run.flows[i]->on_complete(emitters[i + 1u]);
        }
        run.sink->on_complete();
        if (run.control->reason() == stop_reason::cancelled) {
            result = run_cancelled{};
        }
    }
    catch (...) {
        const auto error = std::current_exception();
        run.sink->on_failure(error);
        result = run_failed{error};
    }
    (void) run.control->request_stop(stop_reason::finished);
    release(run);
    std::ostringstream os;
    os << result;
    set_state(run, std::move(result));
    log(run, os.str());
}

run_handle::run_handle() noexcept = default;

run_handle::run_handle(std::shared_ptr<impl> state,
                       std::future<void> r) noexcept:
    pimpl{std::move(state)}, runner{std::move(r)}
{
    // Intentionally empty.
}

run_handle::run_handle(run_handle&& other) noexcept = default;

run_handle::~run_handle()
{
    reset();
}

auto run_handle::operator=(run_handle&& other) noexcept -> run_handle&
{
    if (this != &other) {
        reset();
        pimpl = std::move(other.pimpl);
        runner = std::move(other.runner);
    }
    return *this;
}

auto run_handle::reset() noexcept -> void
{
    if (runner.valid()) {
        try {
            abort();
            runner.get();
        }
        catch (const std::exception& ex) {
            std::cerr << "run_handle::reset(): " << ex.what() << "\n";
        }
    }
    pimpl.reset();
}

auto run_handle::valid() const noexcept -> bool
{
    return pimpl != nullptr;
}

auto run_handle::id() const noexcept -> run_id
{
    return pimpl? pimpl->id: no_run_id;
}

auto run_handle::name() const -> std::string
{
    return pimpl? pimpl->name: std::string{};
}

auto run_handle::state() const -> run_state
{
    if (!pimpl) {
        return run_created{};
    }
    const std::lock_guard lock{pimpl->mutex};
    return pimpl->state;
}

auto run_handle::wait() -> run_state
{
    if (runner.valid()) {
        runner.wait();
    }
    return state();
}

auto run_handle::wait_for(std::chrono::milliseconds timeout) -> run_state
{
    if (runner.valid()) {
        (void) runner.wait_for(timeout);
    }
    return state();
}

auto run_handle::abort() -> bool
{
    if (!pimpl || is_terminal(state())) {
        return false;
    }
    const auto stopped = pimpl->control->request_stop(stop_reason::aborted);
    if (stopped) {
        log(*pimpl, "aborting");
    }
    return stopped;
}

}

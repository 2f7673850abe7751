#include <algorithm> // for std::partition, std::count_if
#include <future> // for std::async
#include <iterator> // for std::make_move_iterator
#include <sstream> // for std::ostringstream
#include <string> // for std::to_string
#include <utility> // for std::move, std::exchange

#include "brook/materializer.hpp"
#include "brook/utility.hpp"

#include "diagnostics.hpp"
#include "run.hpp"

namespace brook {

namespace {

auto make_run_name(const stage_name& prefix, run_id id,
                   const stage_name& name) -> std::string
{
    std::ostringstream os;
    os << prefix << "-" << id;
    if (!name.get().empty()) {
        os << " (" << name << ")";
    }
    return os.str();
}

auto check_runnable(const blueprint& value) -> void
{
    if (!is_runnable(value)) {
        std::ostringstream os;
        os << "blueprint not runnable: " << value;
        throw invalid_blueprint{os.str()};
    }
}

/// @brief Makes fresh logic for every stage of @value into @run.
/// @return The materialized values of the stages in stage order.
auto instantiate(const blueprint& value, const stage_context& context,
                 run_handle::impl& run) -> std::vector<std::any>
{
    const auto last = size(value.stages) - 1u;
    auto values = std::vector<std::any>{};
    values.reserve(size(value.stages));
    auto index = std::size_t{0};
    for (auto&& s: value.stages) {
        const auto role = role_of(*s);
        if ((role == stage_role::source) != (index == 0u) ||
            (role == stage_role::sink) != (index == last)) {
            std::ostringstream os;
            os << "misplaced " << role << " stage " << s->name;
            os << " at " << index;
            throw invalid_blueprint{os.str()};
        }
        auto has_logic = false;
        std::visit(detail::overloaded{
            [&](const source_factory& f) {
                auto made = f(context);
                has_logic = made.logic != nullptr;
                run.source = std::move(made.logic);
                values.push_back(std::move(made.value));
            },
            [&](const flow_factory& f) {
                auto made = f(context);
                has_logic = made.logic != nullptr;
                run.flows.push_back(std::move(made.logic));
                values.push_back(std::move(made.value));
            },
            [&](const sink_factory& f) {
                auto made = f(context);
                has_logic = made.logic != nullptr;
                run.sink = std::move(made.logic);
                values.push_back(std::move(made.value));
            },
        }, s->factory);
        if (!has_logic) {
            throw invalid_blueprint{"stage " + s->name.get() +
                                    " made no logic"};
        }
        ++index;
    }
    return values;
}

}

materializer::materializer(std::ostream& diags,
                           materializer_settings settings):
    settings_{std::move(settings)},
    diags_{std::make_shared<detail::diagnostics>(diags,
                                                 settings_.log_lifecycle)}
{
    // Intentionally empty.
}

materializer::~materializer()
{
    shutdown();
    diags_->close();
}

auto materializer::log(const std::string& what) const -> void
{
    diags_->write(settings_.name.get() + ": " + what);
}

auto materializer::run(const blueprint& value) -> materialized<std::any>
{
    check_runnable(value);
    if (is_shutdown()) {
        throw materializer_closed{
            "materializer " + settings_.name.get() + " is shut down"
        };
    }
    const auto id = run_id{++last_id};
    const auto control = std::make_shared<run_control>();
    auto pimpl = std::make_shared<run_handle::impl>(
        id, make_run_name(settings_.name, id, value.name), control, diags_
    );
    auto values = instantiate(value, stage_context{id, control}, *pimpl);
    auto result = evaluate(value.materialized, values);
    auto runner = std::async(std::launch::async, [pimpl]() {
        execute(*pimpl);
    });
    return {run_handle{std::move(pimpl), std::move(runner)},
            std::move(result)};
}

auto materializer::adopt(run_handle handle) -> void
{
    if (!handle.valid()) {
        return;
    }
    auto ended = std::vector<run_handle>{};
    {
        const std::lock_guard lock{mutex};
        if (closed) {
            ended.push_back(std::move(handle));
        }
        else {
            const auto first_ended = std::partition(
                begin(adopted), end(adopted), [](const run_handle& h) {
                    return !is_terminal(h.state());
                });
            ended.assign(std::make_move_iterator(first_ended),
                         std::make_move_iterator(end(adopted)));
            adopted.erase(first_ended, end(adopted));
            adopted.push_back(std::move(handle));
        }
    }
    // Outside the lock as destroying handles of unfinished runs joins them.
    for (auto&& h: ended) {
        if (!is_terminal(h.state())) {
            log("adopted " + h.name() + " after shutdown");
        }
    }
}

auto materializer::shutdown() -> void
{
    auto runs = std::vector<run_handle>{};
    {
        const std::lock_guard lock{mutex};
        if (closed) {
            return;
        }
        closed = true;
        runs = std::exchange(adopted, {});
    }
    const auto count = std::count_if(begin(runs), end(runs),
                                     [](const run_handle& h) {
        return !is_terminal(h.state());
    });
    log("shutting down, aborting " + std::to_string(count) + " run(s)");
    for (auto&& h: runs) {
        h.abort();
    }
    for (auto&& h: runs) {
        (void) h.wait();
    }
}

auto materializer::is_shutdown() const -> bool
{
    const std::lock_guard lock{mutex};
    return closed;
}

auto materializer::active_runs() const -> std::size_t
{
    const std::lock_guard lock{mutex};
    return static_cast<std::size_t>(
        std::count_if(begin(adopted), end(adopted), [](const run_handle& h) {
            return !is_terminal(h.state());
        }));
}

auto materializer::settings() const noexcept -> const materializer_settings&
{
    return settings_;
}

}

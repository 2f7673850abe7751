#ifndef run_state_hpp
#define run_state_hpp

#include <compare> // for std::strong_ordering
#include <concepts> // for std::regular.
#include <exception> // for std::exception_ptr
#include <ostream>
#include <string>
#include <variant>

namespace brook {

struct run_created {
    constexpr auto operator<=>(const run_created&) const noexcept = default;
};

auto operator<<(std::ostream& os, const run_created&) -> std::ostream&;

struct run_running {
    constexpr auto operator<=>(const run_running&) const noexcept = default;
};

auto operator<<(std::ostream& os, const run_running&) -> std::ostream&;

struct run_completed {
    constexpr auto operator<=>(const run_completed&) const noexcept = default;
};

auto operator<<(std::ostream& os, const run_completed&) -> std::ostream&;

/// @brief Run ended through its <code>cancellable</code>.
/// @note Downstream stages still completed normally.
struct run_cancelled {
    constexpr auto operator<=>(const run_cancelled&) const noexcept = default;
};

auto operator<<(std::ostream& os, const run_cancelled&) -> std::ostream&;

struct run_failed {
    std::exception_ptr error;
    auto operator==(const run_failed&) const noexcept -> bool = default;
};

auto operator<<(std::ostream& os, const run_failed& value) -> std::ostream&;

/// @brief State of a run.
/// @note Runs go from created to running to one of the terminal states:
///   completed, cancelled, or failed.
using run_state = std::variant<
    run_created,
    run_running,
    run_completed,
    run_cancelled,
    run_failed
>;

static_assert(std::regular<run_state>);

auto operator<<(std::ostream& os, const run_state& value) -> std::ostream&;

[[nodiscard]] auto is_terminal(const run_state& value) noexcept -> bool;

/// @brief Gets the explanatory string of the given error.
auto describe(const std::exception_ptr& error) -> std::string;

}

#endif /* run_state_hpp */

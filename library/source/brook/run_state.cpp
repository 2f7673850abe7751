#include "brook/run_state.hpp"

namespace brook {

auto operator<<(std::ostream& os, const run_created&) -> std::ostream&
{
    os << "created";
    return os;
}

auto operator<<(std::ostream& os, const run_running&) -> std::ostream&
{
    os << "running";
    return os;
}

auto operator<<(std::ostream& os, const run_completed&) -> std::ostream&
{
    os << "completed";
    return os;
}

auto operator<<(std::ostream& os, const run_cancelled&) -> std::ostream&
{
    os << "cancelled";
    return os;
}

auto operator<<(std::ostream& os, const run_failed& value) -> std::ostream&
{
    os << "failed: " << describe(value.error);
    return os;
}

auto operator<<(std::ostream& os, const run_state& value) -> std::ostream&
{
    std::visit([&os](const auto& v) { os << v; }, value);
    return os;
}

auto is_terminal(const run_state& value) noexcept -> bool
{
    return std::holds_alternative<run_completed>(value)
        || std::holds_alternative<run_cancelled>(value)
        || std::holds_alternative<run_failed>(value);
}

auto describe(const std::exception_ptr& error) -> std::string
{
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    }
    catch (const std::exception& ex) {
        return ex.what();
    }
    catch (...) { // NOLINT(bugprone-empty-catch)
        return "unknown exception";
    }
}

}

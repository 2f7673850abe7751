#include <utility> // for std::move

#include "brook/cancellable.hpp"

namespace brook {

cancellable::cancellable(std::shared_ptr<run_control> c) noexcept:
    control{std::move(c)}
{
    // Intentionally empty.
}

auto cancellable::cancel() const -> bool
{
    return control? control->request_stop(stop_reason::cancelled): false;
}

auto cancellable::is_cancelled() const -> bool
{
    if (!control) {
        return true;
    }
    const auto why = control->reason();
    return why && (*why != stop_reason::finished);
}

auto cancellable::is_stopped() const -> bool
{
    return control? control->stop_requested(): true;
}

auto operator<<(std::ostream& os, const cancellable& value) -> std::ostream&
{
    os << "cancellable{";
    if (value.is_cancelled()) {
        os << "cancelled";
    }
    else if (value.is_stopped()) {
        os << "finished";
    }
    else {
        os << "active";
    }
    os << "}";
    return os;
}

}

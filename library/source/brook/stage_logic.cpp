#include "brook/stage_logic.hpp"

namespace brook {

auto operator<<(std::ostream& os, demand value) -> std::ostream&
{
    switch (value) {
    case demand::more:
        os << "more";
        return os;
    case demand::cancel:
        os << "cancel";
        return os;
    }
    os << "demand(" << static_cast<int>(value) << ")";
    return os;
}

source_logic::~source_logic() = default;

flow_logic::~flow_logic() = default;

auto flow_logic::on_complete(const emitter&) -> void
{
    // Intentionally empty.
}

sink_logic::~sink_logic() = default;

}

#include "brook/not_used.hpp"

namespace brook {

auto operator<<(std::ostream& os, const not_used&) -> std::ostream&
{
    os << "not-used";
    return os;
}

auto operator<<(std::ostream& os, const done&) -> std::ostream&
{
    os << "done";
    return os;
}

}

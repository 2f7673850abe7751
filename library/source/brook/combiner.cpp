#include <stdexcept> // for std::invalid_argument
#include <utility> // for std::move, std::pair

#include "brook/combiner.hpp"
#include "brook/not_used.hpp"
#include "brook/utility.hpp"

namespace brook {

auto operator<<(std::ostream& os, keep_policy value) -> std::ostream&
{
    switch (value) {
    case keep_policy::left:
        os << "keep-left";
        return os;
    case keep_policy::right:
        os << "keep-right";
        return os;
    case keep_policy::both:
        os << "keep-both";
        return os;
    case keep_policy::none:
        os << "keep-none";
        return os;
    case keep_policy::custom:
        os << "custom";
        return os;
    }
    os << "keep_policy(" << to_underlying(value) << ")";
    return os;
}

auto operator<<(std::ostream& os, const combiner& value) -> std::ostream&
{
    os << value.policy;
    return os;
}

auto combine(const combiner& c, std::any lhs, std::any rhs) -> std::any
{
    if (!c.function) {
        throw std::invalid_argument{"combiner has no function"};
    }
    return c.function(std::move(lhs), std::move(rhs));
}

namespace combiners {

auto keep_left() -> combiner
{
    return {keep_policy::left, [](std::any lhs, std::any) {
        return lhs;
    }};
}

auto keep_right() -> combiner
{
    return {keep_policy::right, [](std::any, std::any rhs) {
        return rhs;
    }};
}

auto keep_both() -> combiner
{
    return {keep_policy::both, [](std::any lhs, std::any rhs) {
        return std::any{std::pair{std::move(lhs), std::move(rhs)}};
    }};
}

auto keep_none() -> combiner
{
    return {keep_policy::none, [](std::any, std::any) {
        return std::any{not_used{}};
    }};
}

}

}

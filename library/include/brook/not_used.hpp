#ifndef not_used_hpp
#define not_used_hpp

#include <compare> // for std::strong_ordering
#include <concepts> // for std::regular.
#include <ostream>

namespace brook {

/// @brief Materialized value of stages that have nothing to offer.
struct not_used {
    constexpr auto operator<=>(const not_used&) const noexcept = default;
};

static_assert(std::regular<not_used>);

auto operator<<(std::ostream& os, const not_used&) -> std::ostream&;

/// @brief Value signalling successful completion with no other result.
struct done {
    constexpr auto operator<=>(const done&) const noexcept = default;
};

static_assert(std::regular<done>);

auto operator<<(std::ostream& os, const done&) -> std::ostream&;

}

#endif /* not_used_hpp */

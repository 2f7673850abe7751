#ifndef keep_hpp
#define keep_hpp

#include <any>
#include <functional> // for std::invoke
#include <type_traits> // for std::invoke_result_t
#include <utility> // for std::move, std::pair

#include "brook/combiner.hpp"
#include "brook/not_used.hpp"

namespace brook {

/// @brief Typed combiners of materialized values.
/// @note Usable wherever the typed graph API takes a combiner, as is any
///   other callable taking the two materialized values.
namespace keep {

struct left_t {
    static constexpr auto policy = keep_policy::left;

    template <class L, class R>
    auto operator()(L lhs, R) const -> L
    {
        return lhs;
    }
};

struct right_t {
    static constexpr auto policy = keep_policy::right;

    template <class L, class R>
    auto operator()(L, R rhs) const -> R
    {
        return rhs;
    }
};

struct both_t {
    static constexpr auto policy = keep_policy::both;

    template <class L, class R>
    auto operator()(L lhs, R rhs) const -> std::pair<L, R>
    {
        return {std::move(lhs), std::move(rhs)};
    }
};

struct none_t {
    static constexpr auto policy = keep_policy::none;

    template <class L, class R>
    auto operator()(L, R) const -> not_used
    {
        return {};
    }
};

inline constexpr auto left = left_t{};
inline constexpr auto right = right_t{};
inline constexpr auto both = both_t{};
inline constexpr auto none = none_t{};

}

template <class Combine, class L, class R>
using combined_t = std::invoke_result_t<const Combine&, L, R>;

template <class Combine>
constexpr auto policy_of() noexcept -> keep_policy
{
    if constexpr (requires { Combine::policy; }) {
        return Combine::policy;
    }
    else {
        return keep_policy::custom;
    }
}

/// @brief Makes an untyped combiner out of a typed one.
/// @note The resulting combiner throws <code>std::bad_any_cast</code> for
///   values that aren't of types @L and @R.
template <class L, class R, class Combine>
auto make_combiner(Combine how) -> combiner
{
    return combiner{
        policy_of<Combine>(),
        [how = std::move(how)](std::any lhs, std::any rhs) -> std::any {
            return std::any{std::invoke(how,
                                        std::any_cast<L>(std::move(lhs)),
                                        std::any_cast<R>(std::move(rhs)))};
        }
    };
}

}

#endif /* keep_hpp */

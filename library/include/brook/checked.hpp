#ifndef checked_hpp
#define checked_hpp

#include <compare> // for std::strong_ordering
#include <ostream>
#include <type_traits>
#include <utility> // for std::forward

namespace brook::detail {

template <class T, class R, class ...Args>
concept functor_returns = std::is_invocable_r_v<R, T, Args...>;

/// @brief Value of type <code>T</code> that's only ever been set to values
///   that <code>Checker</code> accepted.
/// @note <code>Checker</code> is expected to throw for unacceptable values.
template <class T, functor_returns<T> Checker>
struct checked
{
    using value_type = T;
    using checker_type = Checker;

    checked(): data{Checker{}()}
    {
        // Intentionally empty.
    }

    template <class U>
        requires (!std::is_same_v<std::remove_cvref_t<U>, checked> &&
                  functor_returns<Checker, T, U>)
    checked(U&& u): data{Checker{}(std::forward<U>(u))}
    {
        // Intentionally empty.
    }

    explicit operator value_type() const
    {
        return data;
    }

    [[nodiscard]] auto get() const & noexcept -> const value_type&
    {
        return data;
    }

    auto operator==(const checked& other) const -> bool = default;
    auto operator<=>(const checked& other) const = default;

private:
    value_type data;
};

template <class T, class C>
auto operator<<(std::ostream& os, const checked<T, C>& value)
    -> std::ostream&
{
    os << value.get();
    return os;
}

}

#endif /* checked_hpp */

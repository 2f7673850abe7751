#ifndef utility_hpp
#define utility_hpp

#include <type_traits> // for std::underlying_type_t

namespace brook {

namespace detail {
template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
}

/// @brief Converts the given enumerate into its underlying value.
/// @note This is basically a back port from C++23.
template <class Enum>
constexpr auto to_underlying(Enum e) noexcept ->
    decltype(static_cast<std::underlying_type_t<Enum>>(e))
{
    return static_cast<std::underlying_type_t<Enum>>(e);
}

}

#endif /* utility_hpp */

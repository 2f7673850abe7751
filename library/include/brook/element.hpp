#ifndef element_hpp
#define element_hpp

#include <any>
#include <concepts> // for std::copy_constructible
#include <optional>
#include <ostream>
#include <string>
#include <typeindex>
#include <type_traits> // for std::is_object_v
#include <typeinfo>

namespace brook {

/// @brief Type erased stream element.
/// @note Elements pass between the stages of a run by value.
using element = std::any;

/// @brief Identifies the type of the elements carried by a port.
using element_type = std::type_index;

/// @brief Element type of a port, or none if the port is closed.
using port_type = std::optional<element_type>;

/// @brief Types whose values can be stream elements.
template <class T>
concept element_value = std::is_object_v<T> && std::copy_constructible<T>;

template <class T>
auto element_type_of() -> element_type
{
    return element_type{typeid(T)};
}

/// @brief Human readable name of the given type.
/// @note Uses the C++ ABI's demangler where possible.
auto demangled_name(const element_type& type) -> std::string;

auto operator<<(std::ostream& os, const port_type& value) -> std::ostream&;

}

#endif /* element_hpp */

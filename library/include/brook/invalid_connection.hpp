#ifndef invalid_connection_hpp
#define invalid_connection_hpp

#include <stdexcept> // for std::invalid_argument
#include <string>

#include "brook/element.hpp"

namespace brook {

/// @brief Thrown for connections that can't be made.
/// @note This happens at construction time, before anything runs.
struct invalid_connection: std::invalid_argument
{
    invalid_connection(port_type up, port_type down,
                       const std::string& what_arg):
        std::invalid_argument(what_arg), upstream(up), downstream(down)
    {}

    /// @brief Outlet of the upstream side.
    port_type upstream;

    /// @brief Inlet of the downstream side.
    port_type downstream;
};

}

#endif /* invalid_connection_hpp */

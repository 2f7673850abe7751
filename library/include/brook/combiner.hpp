#ifndef combiner_hpp
#define combiner_hpp

#include <any>
#include <functional> // for std::function
#include <ostream>

namespace brook {

/// @brief Which side's materialized value a connection keeps.
enum class keep_policy: int { left, right, both, none, custom };

auto operator<<(std::ostream& os, keep_policy value) -> std::ostream&;

/// @brief Combines the materialized values of two connected blueprints.
/// @note The policy tag documents what the function does. Functions
///   provided by <code>combiners</code> and the typed <code>keep</code>
///   objects are tagged accordingly, everything else is
///   <code>keep_policy::custom</code>.
struct combiner
{
    using function_type = std::function<std::any(std::any, std::any)>;

    keep_policy policy{keep_policy::right};
    function_type function;
};

auto operator<<(std::ostream& os, const combiner& value) -> std::ostream&;

/// @brief Applies the given combiner.
/// @throws std::invalid_argument if @c has no function.
auto combine(const combiner& c, std::any lhs, std::any rhs) -> std::any;

namespace combiners {

/// @brief Keeps the upstream side's value.
auto keep_left() -> combiner;

/// @brief Keeps the downstream side's value.
/// @note This is the default for connections.
auto keep_right() -> combiner;

/// @brief Keeps both as a <code>std::pair<std::any, std::any></code>.
auto keep_both() -> combiner;

/// @brief Keeps neither, giving <code>not_used</code>.
auto keep_none() -> combiner;

}

}

#endif /* combiner_hpp */

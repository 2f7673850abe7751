#ifndef stage_name_hpp
#define stage_name_hpp

#include <concepts> // for std::regular.
#include <string>

#include "brook/charset_checker.hpp"
#include "brook/checked.hpp"

namespace brook {

struct stage_name_checker:
    detail::allowed_chars_checker<detail::name_charset>
{
};

/// @brief Stage name.
/// @details A lexical token for identifying a stage, a blueprint, or a
///   materializer within diagnostics.
/// @note This is a strongly typed <code>std::string</code> that can be
///   constructed from strings containing only characters from its allowed
///   character set. A <code>charset_validator_error</code> exception is
///   thrown otherwise.
using stage_name = detail::checked<std::string, stage_name_checker>;

static_assert(std::regular<stage_name>);

}

#endif /* stage_name_hpp */

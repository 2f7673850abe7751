#include <cctype> // for std::isprint
#include <iomanip> // for std::setw, std::setfill
#include <sstream> // for std::ostringstream
#include <utility> // for std::move

#include "brook/charset_checker.hpp"

namespace brook {

namespace {

auto quoted(char c) -> std::string
{
    std::ostringstream os;
    os << '\'';
    if (std::isprint(static_cast<unsigned char>(c))) {
        os << c;
    }
    else {
        os << "\\x" << std::hex << std::setw(2) << std::setfill('0');
        os << static_cast<unsigned>(static_cast<unsigned char>(c));
    }
    os << '\'';
    return os.str();
}

auto find_offending(std::string_view v, char_list access,
                    std::string_view chars) noexcept
    -> std::string_view::size_type
{
    return (access == char_list::deny)
        ? v.find_first_of(chars)
        : v.find_first_not_of(chars);
}

}

charset_validator_error::charset_validator_error(char badc,
                                                 std::string chars,
                                                 char_list acc,
                                                 const std::string& what_arg):
    std::invalid_argument{what_arg},
    chars_{std::move(chars)}, access_{acc}, badchar_{badc}
{
    // Intentionally empty.
}

auto charset_validator_error::badchar() const noexcept -> char
{
    return badchar_;
}

auto charset_validator_error::access() const noexcept -> char_list
{
    return access_;
}

auto charset_validator_error::charset() const -> std::string
{
    return chars_;
}

auto detail::charset_validator(std::string v,
                               char_list access,
                               std::string_view chars)
    -> std::string
{
    const auto at = find_offending(v, access, chars);
    if (at == std::string::npos) {
        return v;
    }
    const auto c = v[at];
    auto what = quoted(c);
    what += (access == char_list::deny)
        ? " is a denied character"
        : " is not an allowed character";
    what += " at offset " + std::to_string(at);
    throw charset_validator_error{c, std::string{chars}, access, what};
}

}

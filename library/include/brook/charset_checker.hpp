#ifndef charset_checker_hpp
#define charset_checker_hpp

#include <concepts> // for std::convertible_to
#include <stdexcept> // for std::invalid_argument
#include <string>
#include <string_view>
#include <utility> // for std::move

namespace brook {

enum class char_list { deny, allow };

struct charset_validator_error: public std::invalid_argument
{
    charset_validator_error(char badc,
                            std::string chars,
                            char_list acc,
                            const std::string& what_arg);

    [[nodiscard]] auto badchar() const noexcept -> char;
    [[nodiscard]] auto access() const noexcept -> char_list;
    [[nodiscard]] auto charset() const -> std::string;

private:
    std::string chars_;
    char_list access_{char_list::deny};
    char badchar_{};
};

}

namespace brook::detail {

/// @brief Character set validator function.
/// @param[in] v Value to validate.
/// @param[in] access Whether validation is to deny or allow finding of a
///   character from @chars.
/// @param[in] chars Characters which @v should be assessed for having or not.
/// @throws charset_validator_error if @v is invalid.
auto charset_validator(std::string v,
                       char_list access,
                       std::string_view chars)
    -> std::string;

template <class T>
concept is_charset = requires {
    { T::chars } -> std::convertible_to<std::string_view>;
};

template <char_list access, is_charset Charset>
struct charset_checker
{
    static constexpr auto charset = std::string_view{Charset::chars};

    auto operator()() const noexcept // NOLINT(bugprone-exception-escape)
        -> std::string
    {
        return {};
    }

    auto operator()(std::string v) const -> std::string
    {
        return charset_validator(std::move(v), access, charset);
    }

    auto operator()(const char *v) const -> std::string
    {
        return operator()(std::string(v));
    }
};

template <is_charset Charset>
using denied_chars_checker = charset_checker<char_list::deny, Charset>;

template <is_charset Charset>
using allowed_chars_checker = charset_checker<char_list::allow, Charset>;

struct name_charset
{
    static constexpr auto chars = std::string_view{
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz"
        "0123456789"
        "_-"
    };
};

}

#endif /* charset_checker_hpp */

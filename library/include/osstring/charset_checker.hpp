#ifndef charset_checker_hpp
#define charset_checker_hpp

#include <concepts> // for std::same_as
#include <cstddef> // for std::size_t
#include <iterator> // for std::input_iterator
#include <stdexcept> // for std::invalid_argument
#include <string>
#include <string_view>
#include <type_traits> // for std::remove_cvref_t
#include <utility> // for std::move

#include "osstring/charset.hpp"

namespace osstring {

/// @brief Error for a single character that's denied by a string's charset.
struct invalid_character_error: public std::invalid_argument
{
    using invalid_argument::invalid_argument;

    invalid_character_error(char badc,
                            std::string chars,
                            const std::string& what_arg = {});

    [[nodiscard]] auto badchar() const noexcept -> char;
    [[nodiscard]] auto charset() const -> std::string;

private:
    std::string chars_;
    char badchar_{};
};

/// @brief Error for a denied character found while validating a whole string.
/// @note Only the first denied character found gets reported.
struct invalid_content_error: public invalid_character_error
{
    invalid_content_error(char badc,
                          std::size_t pos,
                          std::string chars,
                          const std::string& what_arg = {});

    /// @brief Zero-based position of the bad character in the checked string.
    [[nodiscard]] auto position() const noexcept -> std::size_t;

private:
    std::size_t position_{};
};

}

namespace osstring::detail {

/// @brief Writes a description of the given character suitable for an
///   exception message.
/// @note Non-printable characters are written as a backslash followed by
///   their octal value. So the null-character comes out as <code>\0</code>.
auto describe_char(char c) -> std::string;

/// @brief Throws an <code>invalid_character_error</code> for the given
///   character and denied charset.
[[noreturn]] auto throw_invalid_character(char c, std::string_view chars)
    -> void;

/// @brief Character set validator function.
/// @param[in] v Value to validate.
/// @param[in] chars Characters which @v may not contain.
/// @return The given value, if it's valid.
/// @throws invalid_content_error if @v is invalid.
auto charset_validator(std::string v, std::string_view chars)
    -> std::string;

/// @brief Views the whole given character array.
/// @note A terminating null-character, if any, isn't part of the view. Any
///   other null-characters are, unlike when the array decays to a pointer.
template <std::size_t N>
constexpr auto array_view(const char (&v)[N]) noexcept -> std::string_view
{
    return std::string_view(v, (N > 0u && v[N - 1u] == '\0')? N - 1u: N);
}

template <class T>
concept is_char_pointer =
    std::same_as<std::remove_cvref_t<T>, const char*> ||
    std::same_as<std::remove_cvref_t<T>, char*>;

template <is_charset Charset>
struct denied_chars_checker
{
    static constexpr auto charset = std::string_view(Charset{});

    auto operator()() const noexcept // NOLINT(bugprone-exception-escape)
        -> std::string
    {
        return {};
    }

    auto operator()(std::string v) const -> std::string
    {
        return charset_validator(std::move(v), charset);
    }

    auto operator()(const std::string_view& v) const -> std::string
    {
        return operator()(std::string(v));
    }

    /// @note Arrays are checked in full, so embedded null-characters are
    ///   found rather than ending the string.
    template <std::size_t N>
    auto operator()(const char (&v)[N]) const -> std::string
    {
        return operator()(std::string(array_view(v)));
    }

    template <is_char_pointer T>
    auto operator()(T&& v) const -> std::string
    {
        return operator()(std::string(v));
    }

    template <std::input_iterator InputIt>
    auto operator()(InputIt first, InputIt last) const -> std::string
    {
        return operator()(std::string(first, last));
    }
};

}

#endif /* charset_checker_hpp */

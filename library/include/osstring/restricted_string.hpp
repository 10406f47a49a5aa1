#ifndef restricted_string_hpp
#define restricted_string_hpp

#include <compare> // for std::strong_ordering
#include <cstddef> // for std::size_t
#include <functional> // for std::hash, std::less_equal
#include <iterator> // for std::input_iterator
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility> // for std::exchange, std::move

#include "osstring/charset.hpp"
#include "osstring/charset_checker.hpp"

namespace osstring {

/// @brief End-relative index.
/// @details <code>from_end{1}</code> identifies the last character,
///   <code>from_end{size()}</code> the first.
struct from_end
{
    std::size_t value{};
};

/// @brief String that never contains any of the characters of a charset.
/// @details This is a strongly typed <code>std::string</code> for values
///   headed to operating system interfaces, like file paths or process
///   arguments, which can't accept certain characters. Every operation that
///   could introduce characters checks them against the denied charset and
///   leaves the value unmodified on failure.
/// @note Mutations are limited to simple operations. For heavier processing,
///   <code>release</code> the content, work on the <code>std::string</code>,
///   then construct a new value from it. Both conversions are moves.
/// @throws invalid_content_error if an attempt is made to construct this
///   type from a string with one or more denied characters.
template <detail::is_charset Charset>
class restricted_string
{
public:
    using charset_type = Charset;
    using checker_type = detail::denied_chars_checker<Charset>;
    using value_type = std::string;
    using size_type = value_type::size_type;
    using const_iterator = value_type::const_iterator;

    /// @brief Characters which this type of string may not contain.
    static constexpr auto charset() noexcept -> std::string_view
    {
        return checker_type::charset;
    }

    /// @brief Makes a value from the given string with all of the denied
    ///   characters removed.
    /// @note Order of the remaining characters is preserved.
    static auto filter(value_type s) noexcept -> restricted_string
    {
        std::erase_if(s, [](char c) noexcept {
            return Charset::contains(c);
        });
        return restricted_string{unchecked_tag{}, std::move(s)};
    }

    restricted_string() noexcept = default;

    restricted_string(const restricted_string& other) = default;

    restricted_string(restricted_string&& other) noexcept:
        data_{std::exchange(other.data_, value_type{})}
    {
        // Intentionally empty.
    }

    template <class U, class V = std::enable_if_t<
        !std::is_same_v<std::decay_t<U>, restricted_string> &&
        std::is_invocable_r_v<value_type, checker_type, U>
    >>
    explicit restricted_string(U&& u): data_{
        checker_type{}(std::forward<U>(u)) // NOLINT(cppcoreguidelines-pro-bounds-array-to-pointer-decay)
    }
    {
        // Intentionally empty.
    }

    template<std::input_iterator InputIt, class U = std::enable_if_t<
        std::is_invocable_r_v<value_type, checker_type, InputIt, InputIt>
    >>
    explicit restricted_string(InputIt first, InputIt last)
        : data_{checker_type{}(first, last)}
    {
        // Intentionally empty.
    }

    auto operator=(const restricted_string& other)
        -> restricted_string& = default;

    auto operator=(restricted_string&& other) noexcept -> restricted_string&
    {
        if (this != &other) {
            data_ = std::exchange(other.data_, value_type{});
        }
        return *this;
    }

    [[nodiscard]] auto size() const noexcept -> size_type
    {
        return data_.size();
    }

    [[nodiscard]] auto length() const noexcept -> size_type
    {
        return data_.length();
    }

    [[nodiscard]] auto empty() const noexcept -> bool
    {
        return data_.empty();
    }

    /// @throws std::out_of_range if <code>pos</code> is not less than the
    ///   size of this string.
    [[nodiscard]] auto at(size_type pos) const -> char
    {
        return data_.at(pos);
    }

    /// @throws std::out_of_range if <code>pos.value</code> is zero or greater
    ///   than the size of this string.
    [[nodiscard]] auto at(from_end pos) const -> char
    {
        // Too large a value wraps around to an out of range index.
        return data_.at(data_.size() - pos.value);
    }

    /// @brief Sets the character at the given position.
    /// @throws invalid_character_error if <code>c</code> is a denied character.
    /// @throws std::out_of_range if <code>pos</code> is not less than the
    ///   size of this string.
    auto set(size_type pos, char c) -> void
    {
        check(c);
        data_.at(pos) = c;
    }

    auto append(const restricted_string& other) -> restricted_string&
    {
        data_.append(other.data_);
        return *this;
    }

    /// @brief Appends the given string's characters.
    /// @throws invalid_character_error if <code>s</code> contains a denied
    ///   character. This string is then left as it was before the call.
    auto append(std::string_view s) -> restricted_string&
    {
        if (is_within(s)) {
            // Characters of this string are already known to be valid, and
            // reserving could invalidate them.
            data_.append(s);
            return *this;
        }
        const auto original_size = data_.size();
        data_.reserve(original_size + s.size());
        for (const auto c: s) {
            if (Charset::contains(c)) {
                data_.resize(original_size);
                detail::throw_invalid_character(c, charset());
            }
            data_.push_back(c);
        }
        return *this;
    }

    /// @brief Appends all of the given array's characters.
    /// @note A terminating null-character isn't appended, any other
    ///   null-character is checked like the rest.
    template <std::size_t N>
    auto append(const char (&s)[N]) -> restricted_string&
    {
        return append(detail::array_view(s));
    }

    /// @throws invalid_character_error if <code>c</code> is a denied character.
    auto append(char c) -> restricted_string&
    {
        check(c);
        data_.push_back(c);
        return *this;
    }

    auto push_back(char c) -> void
    {
        append(c);
    }

    auto operator+=(const restricted_string& other) -> restricted_string&
    {
        return append(other);
    }

    auto operator+=(std::string_view s) -> restricted_string&
    {
        return append(s);
    }

    template <std::size_t N>
    auto operator+=(const char (&s)[N]) -> restricted_string&
    {
        return append(s);
    }

    auto operator+=(char c) -> restricted_string&
    {
        return append(c);
    }

    auto clear() noexcept -> void
    {
        data_.clear();
    }

    [[nodiscard]] auto get() const & noexcept -> const value_type&
    {
        return data_;
    }

    [[nodiscard]] auto view() const noexcept -> std::string_view
    {
        return data_;
    }

    [[nodiscard]] auto data() const noexcept -> const char*
    {
        return data_.data();
    }

    /// @brief Null-terminated content, suitable for C APIs.
    /// @note For a charset denying the null-character, the returned string
    ///   is guaranteed to be exactly this string's content.
    [[nodiscard]] auto c_str() const noexcept -> const char*
    {
        return data_.c_str();
    }

    [[nodiscard]] auto begin() const noexcept -> const_iterator
    {
        return data_.begin();
    }

    [[nodiscard]] auto end() const noexcept -> const_iterator
    {
        return data_.end();
    }

    /// @brief Moves the content out, leaving this string empty.
    [[nodiscard]] auto release() && noexcept -> value_type
    {
        return std::exchange(data_, value_type{});
    }

    explicit operator value_type() const
    {
        return data_;
    }

    explicit operator std::string_view() const noexcept
    {
        return data_;
    }

private:
    struct unchecked_tag {};

    restricted_string(unchecked_tag, value_type s) noexcept:
        data_{std::move(s)}
    {
        // Intentionally empty.
    }

    static auto check(char c) -> void
    {
        if (Charset::contains(c)) {
            detail::throw_invalid_character(c, charset());
        }
    }

    auto is_within(std::string_view s) const noexcept -> bool
    {
        const auto first = data_.data();
        const auto last = first + data_.size();
        return std::less_equal<>{}(first, s.data()) &&
               std::less_equal<>{}(s.data() + s.size(), last) &&
               !s.empty();
    }

    value_type data_;
};

/// @brief Makes a restricted string from the given string with all of the
///   denied characters removed.
template <detail::is_charset Charset>
auto filter(std::string s) noexcept -> restricted_string<Charset>
{
    return restricted_string<Charset>::filter(std::move(s));
}

template <class C>
inline auto operator==(const restricted_string<C>& lhs,
                       const restricted_string<C>& rhs) noexcept -> bool
{
    return lhs.view() == rhs.view();
}

template <class C>
inline auto operator==(const restricted_string<C>& lhs,
                       std::string_view rhs) noexcept -> bool
{
    return lhs.view() == rhs;
}

template <class C, std::size_t N>
inline auto operator==(const restricted_string<C>& lhs,
                       const char (&rhs)[N]) noexcept -> bool
{
    return lhs.view() == detail::array_view(rhs);
}

template <class C>
inline auto operator<=>(const restricted_string<C>& lhs,
                        const restricted_string<C>& rhs) noexcept
    -> std::strong_ordering
{
    return lhs.view() <=> rhs.view();
}

template <class C>
auto operator<<(std::ostream& os, const restricted_string<C>& value)
    -> std::ostream&
{
    os << value.view();
    return os;
}

}

namespace std {

template <class C>
struct hash<osstring::restricted_string<C>>
{
    auto operator()(const osstring::restricted_string<C>& value) const noexcept
        -> std::size_t
    {
        return std::hash<std::string_view>{}(value.view());
    }
};

}

#endif /* restricted_string_hpp */

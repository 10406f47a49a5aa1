#ifndef charset_hpp
#define charset_hpp

#include <array>
#include <concepts> // for std::convertible_to, std::same_as
#include <string>
#include <string_view>

namespace osstring::detail {

/// @brief Template character string.
/// @details A compile-time sequence of characters usable as a character set.
template <char... chars>
struct tcstring
{
    static constexpr auto data() noexcept
    {
        return std::data(ntbs);
    }

    static constexpr auto size() noexcept
    {
        return std::size(ntbs) - 1u;
    }

    static constexpr auto begin() noexcept
    {
        return std::begin(ntbs);
    }

    static constexpr auto end() noexcept
    {
        return std::end(ntbs) - 1u;
    }

    /// @brief Whether the given character is one of this string's characters.
    static constexpr auto contains(char c) noexcept -> bool
    {
        return ((c == chars) || ...);
    }

    operator std::string() const
    {
        return std::string{data(), size()};
    }

    constexpr operator std::string_view() const noexcept
    {
        return std::string_view{data(), size()};
    }

private: // prevent direct access to underlying implementation...
    static constexpr auto ntbs = std::array<char, sizeof...(chars) + 1u>{
        chars..., '\0'
    };
};

template <typename...> struct char_template_joiner;

template <
    template<char...> class Tpl,
    char ...Args1>
struct char_template_joiner<Tpl<Args1...>>
{
    using type = Tpl<Args1...>;
};

template <
    template<char...> class Tpl,
    char ...Args1,
    char ...Args2,
    typename ...Tail>
struct char_template_joiner<Tpl<Args1...>, Tpl<Args2...>, Tail...>
{
    using type = typename char_template_joiner<Tpl<Args1..., Args2...>, Tail...>::type;
};

/// @brief Union of the given character sets.
/// @note Duplicated characters are harmless: membership is all that's used.
template <class... Charsets>
using charset_union = typename char_template_joiner<Charsets...>::type;

template <class T>
concept is_charset = requires(char c)
{
    {T::contains(c)} -> std::same_as<bool>;
    requires std::convertible_to<T, std::string_view>;
};

using nul_charset = tcstring<'\0'>;

static_assert(is_charset<nul_charset>);
static_assert(nul_charset::size() == 1u);
static_assert(nul_charset::contains('\0'));
static_assert(!nul_charset::contains('0'));
static_assert(!tcstring<>::contains('\0'));

}

#endif /* charset_hpp */

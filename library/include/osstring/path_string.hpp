#ifndef path_string_hpp
#define path_string_hpp

#include <concepts> // for std::regular
#include <string>
#include <type_traits>

#include "osstring/charset.hpp"
#include "osstring/restricted_string.hpp"

namespace osstring {

extern template class restricted_string<detail::nul_charset>;

/// @brief String without any null-characters.
/// @details Mainly for file paths and process arguments, which operating
///   system interfaces receive as null-terminated strings.
/// @see to_path_string.
using path_string = restricted_string<detail::nul_charset>;

static_assert(std::regular<path_string>);
static_assert(std::totally_ordered<path_string>);
static_assert(std::is_nothrow_default_constructible_v<path_string>);
static_assert(std::is_nothrow_move_constructible_v<path_string>);
static_assert(std::is_nothrow_move_assignable_v<path_string>);
static_assert(!std::is_convertible_v<std::string, path_string>);

/// @brief Checked conversion to <code>path_string</code>.
/// @throws invalid_content_error if <code>s</code> contains a null-character.
auto to_path_string(std::string s) -> path_string;

}

#endif /* path_string_hpp */

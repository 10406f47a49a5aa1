#include <cctype> // for std::isprint
#include <sstream> // for std::ostringstream

#include "osstring/charset_checker.hpp"

namespace osstring {

namespace {

auto make_message(char c, std::size_t pos) -> std::string
{
    std::ostringstream os;
    os << "may not contain '" << detail::describe_char(c) << "'";
    os << ", character denied";
    os << " at position " << pos;
    return os.str();
}

auto make_message(char c) -> std::string
{
    std::ostringstream os;
    os << "may not contain '" << detail::describe_char(c) << "'";
    os << ", character denied";
    return os.str();
}

}

invalid_character_error::invalid_character_error(char c,
                                                 std::string chars,
                                                 const std::string& what_arg):
    invalid_argument(empty(what_arg)? make_message(c): what_arg),
    chars_(std::move(chars)), badchar_(c)
{
    // Intentionally empty.
}

auto invalid_character_error::charset() const -> std::string
{
    return chars_;
}

auto invalid_character_error::badchar() const noexcept -> char
{
    return badchar_;
}

invalid_content_error::invalid_content_error(char c,
                                             std::size_t pos,
                                             std::string chars,
                                             const std::string& what_arg):
    invalid_character_error(c, std::move(chars),
                            empty(what_arg)? make_message(c, pos): what_arg),
    position_(pos)
{
    // Intentionally empty.
}

auto invalid_content_error::position() const noexcept -> std::size_t
{
    return position_;
}

}

namespace osstring::detail {

auto describe_char(char c) -> std::string
{
    std::ostringstream os;
    if (std::isprint(static_cast<unsigned char>(c))) {
        os << c;
    }
    else {
        os << "\\" << std::oct << int(static_cast<unsigned char>(c));
    }
    return os.str();
}

auto throw_invalid_character(char c, std::string_view chars) -> void
{
    throw invalid_character_error{c, std::string(chars)};
}

auto charset_validator(std::string v, std::string_view chars)
    -> std::string
{
    if (const auto found = std::string_view(v).find_first_of(chars);
        found != std::string_view::npos) {
        throw invalid_content_error{v[found], found, std::string(chars)};
    }
    return v;
}

}

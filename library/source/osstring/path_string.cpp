#include "osstring/path_string.hpp"

namespace osstring {

template class restricted_string<detail::nul_charset>;

auto to_path_string(std::string s) -> path_string
{
    return path_string{std::move(s)};
}

}

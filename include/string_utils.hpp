#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <string>
#include <string_view>

namespace string_utils {

// Strips leading and trailing whitespace (space, tab, CR, LF, VT, FF)
std::string trim(std::string_view text);

std::string to_lower(std::string_view text);

} // namespace string_utils

#endif // STRING_UTILS_HPP

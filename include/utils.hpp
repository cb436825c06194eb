#ifndef DIAL_RESPONDER_UTILS_HPP
#define DIAL_RESPONDER_UTILS_HPP

#include <string>
#include <string_view>

namespace utils
{

std::string get_local_ipaddr();

bool is_valid_utf8(std::string_view text);

bool iequals(std::string_view lhs, std::string_view rhs);

std::string_view trim(std::string_view view);

} // utils

#endif

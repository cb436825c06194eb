#include "http/request.hpp"

#include <stdexcept>

namespace http
{

request::request(std::string_view unparsed_request)
{
    parse(unparsed_request);
}

void request::parse(std::string_view request)
{
    parse_result res = parse_message(request);
    if(const parse_error* err = std::get_if<parse_error>(&res))
        throw std::invalid_argument {std::string {"invalid_request: "} + std::string {http::to_string(*err)}};

    m_message = std::move(std::get<message>(res));

    /* Routing only looks at the path, so query string and fragment are cut off */
    std::string_view resource {m_message.second()};
    m_path = std::string {resource.substr(0, resource.find_first_of("?#"))};
}

std::string request::get_header(std::string_view key) const
{
    auto value = m_message.get_header(key);
    if(value)
        return std::string {*value};
    else
        return "";
}

} // namespace http

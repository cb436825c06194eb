#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include <string>
#include <string_view>

#include "http/message.hpp"

namespace http {

class request {

public:

    request() = default;
    request(const request& other) = default;
    request(request&& other) = default;
    request& operator=(const request& other) = default;
    request& operator=(request&& other) = default;

    /// Throws std::invalid_argument if the request can not be parsed
    explicit request(std::string_view request_string);

    void parse(std::string_view request);

    std::string to_string() const { return m_message.to_string(); }

    bool check_header(std::string_view key) const { return m_message.check_header(key); }

    const header_list& get_headers() const { return m_message.get_headers(); }

    std::string get_header(std::string_view key) const;

    const std::string& get_method() const { return m_message.first(); }

    const std::string& get_resource() const { return m_message.second(); }

    const std::string& get_protocol() const { return m_message.third(); }

    const std::string& get_path() const { return m_path; }

private:

    message m_message;     /// parsed request line, headers and body

    std::string m_path;    /// path of the resource addressed by this request, without query and fragment

};

} // namespace http

#endif

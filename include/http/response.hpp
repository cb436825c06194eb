#ifndef HTTP_RESPONSE_HPP
#define HTTP_RESPONSE_HPP

#include <string>
#include <stdexcept>

#include "http/message.hpp"

namespace http
{

/// Thrown when a file backing a response body can not be read
class asset_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class response
{
public:

    response() = default;

    std::string to_string() const;

    /// Parsed form of the response as it would go on the wire, without the Date header
    message to_message() const;

    void set_body_from_file(const std::string& body_file);

    void set_header(const std::string& key, const std::string& value);

    void set_header(const std::string& key, std::string&& value);

    void set_code(int code)
    {
        m_code = code;
        m_phrase.clear();
    }

    void set_code(int code, std::string&& phrase)
    {
        m_code = code; m_phrase = std::move(phrase);
    }

    void set_body(const std::string& body);

    void set_body(std::string&& body);

    int get_code() const
    {
        return m_code;
    }

    const std::string& get_body() const
    {
        return m_body;
    }

    const header_list& get_headers() const
    {
        return m_headers.get_headers();
    }

private:

    int m_code = 200;
    std::string m_phrase;
    std::string m_body;

    message m_headers;     /// only the header list of this message is used

};

std::string get_http_phrase(int status_code);

/// Whole content of a file, throws asset_error
std::string read_file(const std::string& path);

} // namespace http

#endif

#ifndef HTTP_MESSAGE_HPP
#define HTTP_MESSAGE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <optional>
#include <variant>
#include <stdexcept>

namespace http
{

using header = std::pair<std::string, std::string>;
using header_list = std::vector<header>;

class invalid_header_value : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

class invalid_header_name : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * Text message framed like HTTP/1.1 as used by both SSDP (over UDP) and the
 * descriptor webserver (over TCP).
 *
 * The start line always consists of three tokens:
 *  - requests:  method, target, version    e.g. "NOTIFY * HTTP/1.1"
 *  - responses: version, status, reason    e.g. "HTTP/1.1 200 OK"
 *
 * Headers keep their insertion order and the case of their names.
 */
class message
{
public:

    message() = default;
    message(const message&) = default;
    message& operator=(const message&) = default;
    message(message&&) = default;
    message& operator=(message&&) = default;
    ~message() = default;

    message(std::string first, std::string second, std::string third);

    /// Throws invalid_header_name or invalid_header_value
    void add_header(std::string key, std::string value);

    /// Replaces the value of the first header with a matching name or appends a new one
    void set_header(std::string key, std::string value);

    /// Case-insensitive lookup of the first header named key
    std::optional<std::string_view> get_header(std::string_view key) const;

    bool check_header(std::string_view key) const
    {
        return get_header(key).has_value();
    }

    const header_list& get_headers() const
    {
        return m_headers;
    }

    const std::string& first() const { return m_first; }

    const std::string& second() const { return m_second; }

    const std::string& third() const { return m_third; }

    const std::string& get_body() const { return m_body; }

    void set_body(std::string body) { m_body = std::move(body); }

    /// Serializes to the exact wire form: start line, headers, empty line, body
    std::string to_string() const;

private:

    std::string m_first;
    std::string m_second;
    std::string m_third;

    header_list m_headers;

    std::string m_body;

};

enum class parse_error
{
    invalid_encoding,       /// payload is not valid UTF-8
    empty_message,          /// no start line at all
    malformed_start_line    /// start line has fewer than three tokens
};

using parse_result = std::variant<message, parse_error>;

/**
 * Parses a raw HTTP-framed message.
 *
 * Lines may end in "\r\n" or "\n". Header lines that are not of the form
 * "Key: Value" are skipped. Everything after the first empty line is kept
 * as the body.
 */
parse_result parse_message(std::string_view raw);

std::string_view to_string(parse_error err);

bool valid_header_name(std::string_view key);

bool valid_header_value(std::string_view value);

} // namespace http

#endif

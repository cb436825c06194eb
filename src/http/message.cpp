#include "http/message.hpp"
#include "utils.hpp"

#include <algorithm>

namespace http
{

message::message(std::string first, std::string second, std::string third)
    : m_first {std::move(first)},
      m_second {std::move(second)},
      m_third {std::move(third)}
{}

bool valid_header_name(std::string_view key)
{
    if(key.empty())
        return false;

    constexpr std::string_view separators {"()<>@,;:\\\"/[]?={} \t"};
    return std::none_of(key.begin(), key.end(), [&separators](char c) {
        const auto u = static_cast<unsigned char>(c);
        return u <= 0x20 || u >= 0x7F || separators.find(c) != std::string_view::npos;
    });
}

bool valid_header_value(std::string_view value)
{
    return std::none_of(value.begin(), value.end(), [](char c) {
        const auto u = static_cast<unsigned char>(c);
        return u >= 0x7F || (u < 0x20 && c != '\t');
    });
}

void message::add_header(std::string key, std::string value)
{
    if(!valid_header_name(key))
        throw invalid_header_name {"Invalid header name: " + key};
    if(!valid_header_value(value))
        throw invalid_header_value {"Invalid value for header " + key};

    m_headers.emplace_back(std::move(key), std::move(value));
}

void message::set_header(std::string key, std::string value)
{
    auto it = std::find_if(m_headers.begin(), m_headers.end(), [&key](const header& h) {
        return utils::iequals(h.first, key);
    });

    if(it == m_headers.end())
    {
        add_header(std::move(key), std::move(value));
        return;
    }

    if(!valid_header_value(value))
        throw invalid_header_value {"Invalid value for header " + key};
    it->second = std::move(value);
}

std::optional<std::string_view> message::get_header(std::string_view key) const
{
    auto it = std::find_if(m_headers.begin(), m_headers.end(), [&key](const header& h) {
        return utils::iequals(h.first, key);
    });

    if(it != m_headers.end())
        return std::string_view {it->second};
    else
        return std::nullopt;
}

std::string message::to_string() const
{
    std::string out;
    out.reserve(128 + m_body.size());

    ((((out += m_first) += ' ') += m_second) += ' ') += m_third;
    out += "\r\n";

    for(const auto& [key, value] : m_headers)
        (((out += key) += ": ") += value) += "\r\n";

    out += "\r\n";
    out += m_body;

    return out;
}

/// Returns the next line without its terminator and advances view past it
static std::string_view next_line(std::string_view& view, bool& terminated)
{
    size_t endl = view.find('\n');
    terminated = endl != std::string_view::npos;

    std::string_view line = view.substr(0, endl);
    view.remove_prefix(terminated ? endl + 1 : view.size());

    if(!line.empty() && line.back() == '\r')
        line.remove_suffix(1);
    return line;
}

parse_result parse_message(std::string_view raw)
{
    if(!utils::is_valid_utf8(raw))
        return parse_error::invalid_encoding;

    bool terminated;
    std::string_view view = raw;
    std::string_view start_line = next_line(view, terminated);
    if(start_line.empty())
        return parse_error::empty_message;

    /* Start line: first two tokens are separated by single spaces, the rest is the third token */
    size_t first_end = start_line.find(' ');
    if(first_end == std::string_view::npos)
        return parse_error::malformed_start_line;
    size_t second_end = start_line.find(' ', first_end + 1);
    if(second_end == std::string_view::npos)
        return parse_error::malformed_start_line;

    std::string_view first {start_line.data(), first_end};
    std::string_view second {start_line.data() + first_end + 1, second_end - first_end - 1};
    std::string_view third = utils::trim(start_line.substr(second_end + 1));
    if(first.empty() || second.empty() || third.empty())
        return parse_error::malformed_start_line;

    message msg {std::string {first}, std::string {second}, std::string {third}};

    /* Headers until the first empty line */
    while(!view.empty())
    {
        std::string_view line = next_line(view, terminated);
        if(line.empty())
            break;

        size_t sep = line.find(':');
        if(sep == std::string_view::npos)
            continue;

        std::string_view key = line.substr(0, sep);
        std::string_view value = utils::trim(line.substr(sep + 1));
        if(!valid_header_name(key) || !valid_header_value(value))
            continue;

        msg.add_header(std::string {key}, std::string {value});
    }

    msg.set_body(std::string {view});
    return msg;
}

std::string_view to_string(parse_error err)
{
    switch(err)
    {
        case parse_error::invalid_encoding:
            return "invalid utf-8 encoding";
        case parse_error::empty_message:
            return "empty message";
        case parse_error::malformed_start_line:
            return "malformed start line";
    }
    return "unknown parse error";
}

} // namespace http

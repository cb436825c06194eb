#include <fstream>
#include <sstream>
#include <chrono>
#include <ctime>

#include "fmt/chrono.h"

#include <http/response.hpp>

namespace http
{

std::string get_http_phrase(int status_code)
{
    switch(status_code)
    {
        case 200: return "OK";
        case 204: return "No Content";
        case 302: return "Found";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

message response::to_message() const
{
    message msg {"HTTP/1.1", std::to_string(m_code), m_phrase.empty() ? get_http_phrase(m_code) : m_phrase};

    for(const auto& [key, value] : m_headers.get_headers())
        msg.add_header(key, value);

    /* Set some response fields if missing */
    if(!m_headers.check_header("Content-Type") && !m_body.empty())
        msg.add_header("Content-Type", "text/html; charset=UTF-8");
    if(!m_headers.check_header("Content-Length"))
        msg.add_header("Content-Length", std::to_string(m_body.size()));

    msg.set_body(m_body);
    return msg;
}

std::string response::to_string() const
{
    message msg = to_message();

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    msg.set_header("Date", fmt::format("{:%a, %d %b %Y %H:%M:%S} GMT", fmt::gmtime(now)));

    return msg.to_string();
}

std::string read_file(const std::string& path)
{
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs.good())
        throw asset_error {"Requested file not found: " + path};

    std::stringstream sstr;
    sstr << ifs.rdbuf();
    if(ifs.bad())
        throw asset_error {"Failed to read file: " + path};

    return sstr.str();
}

void response::set_body_from_file(const std::string& body_file)
{
    this->set_body(read_file(body_file));
}

void response::set_body(const std::string& body)
{
    m_body = body;
    set_header("Content-Length", std::to_string(m_body.size()));
}

void response::set_body(std::string&& body)
{
    m_body = std::move(body);
    set_header("Content-Length", std::to_string(m_body.size()));
}

void response::set_header(const std::string& key, const std::string& value)
{
    m_headers.set_header(key, value);
}

void response::set_header(const std::string& key, std::string&& value)
{
    m_headers.set_header(key, std::move(value));
}

} // namespace http

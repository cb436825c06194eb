#ifndef HTTP_REQUEST_HANDLER_HPP
#define HTTP_REQUEST_HANDLER_HPP

#include <string>
#include <string_view>

#include "http/request.hpp"
#include "http/response.hpp"

namespace http
{

#define DESCRIPTOR_PATH "/upnp_device_descriptor.xml"

/// Device description document served verbatim from disk
class descriptor_asset
{
public:

    explicit descriptor_asset(std::string path)
        : m_path {std::move(path)}
    {}

    /// Reads the whole file on every call, throws asset_error
    std::string read() const;

    const std::string& path() const
    {
        return m_path;
    }

private:

    std::string m_path;

};

/// Routes one request of the descriptor webserver to its response
class request_handler
{
public:

    explicit request_handler(descriptor_asset asset)
        : m_asset {std::move(asset)}
    {}

    /// Parses raw and routes it. Never throws for bad input, answers 400 instead.
    response handle(std::string_view raw) const;

    response route(const request& req) const;

private:

    response landing_page() const;

    response device_descriptor() const;

    descriptor_asset m_asset;

};

} // namespace http

#endif

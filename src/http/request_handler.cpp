#include "http/request_handler.hpp"
#include "logging.hpp"

#include <stdexcept>

namespace http
{

static const char* landing_body =
    "<html>\n"
    "<head><title>dial_responder</title></head>\n"
    "<body>dial_responder is running. The device description is available at "
    "<a href=\"" DESCRIPTOR_PATH "\">" DESCRIPTOR_PATH "</a>.</body>\n"
    "</html>\n";

std::string descriptor_asset::read() const
{
    return read_file(m_path);
}

response request_handler::handle(std::string_view raw) const
{
    request req;
    try {
        req.parse(raw);
    } catch(const std::invalid_argument& e) {
        logging::debug("Rejecting request: {}", e.what());
        response res;
        res.set_code(400);
        res.set_header("Connection", "close");
        return res;
    }

    logging::debug("{} {}", req.get_method(), req.get_resource());
    response res = route(req);
    res.set_header("Connection", "close");
    return res;
}

response request_handler::route(const request& req) const
{
    if(req.get_method() == "GET" && req.get_path() == "/")
        return landing_page();
    if(req.get_method() == "GET" && req.get_path() == DESCRIPTOR_PATH)
        return device_descriptor();

    response res;
    res.set_code(404);
    return res;
}

response request_handler::landing_page() const
{
    response res;
    res.set_code(200);
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Content-Type", "text/html; charset=utf-8");
    res.set_body(landing_body);
    return res;
}

response request_handler::device_descriptor() const
{
    response res;
    try {
        std::string xml = m_asset.read();
        res.set_code(200);
        res.set_header("Content-Type", "application/xml");
        res.set_body(std::move(xml));
    } catch(const asset_error& e) {
        logging::error("Can not serve device descriptor: {}", e.what());
        res.set_code(500);
    }
    return res;
}

} // namespace http

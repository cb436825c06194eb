#include "ssdp/messages.hpp"

#include "fmt/format.h"

#include <stdexcept>

namespace ssdp
{

std::vector<advertisement_target> default_advertisements()
{
    return {
        advertisement_target {advertisement_role::root_device, "", ""},
        advertisement_target {advertisement_role::embedded_device, "", ""},
        advertisement_target {advertisement_role::device_type, "Basic", "1"}
    };
}

std::string notification_type(const device_identity& identity, const advertisement_target& target)
{
    switch(target.role)
    {
        case advertisement_role::root_device:
            return "upnp:rootdevice";
        case advertisement_role::embedded_device:
            return fmt::format("uuid:{}", identity.uuid);
        case advertisement_role::device_type:
            return fmt::format("urn:schemas-upnp-org:device:{}:{}", target.type_name, target.version);
        case advertisement_role::service_type:
            return fmt::format("urn:schemas-upnp-org:service:{}:{}", target.type_name, target.version);
    }
    throw std::invalid_argument {"Unknown advertisement role"};
}

std::string unique_service_name(const device_identity& identity, const advertisement_target& target)
{
    if(target.role == advertisement_role::embedded_device)
        return fmt::format("uuid:{}", identity.uuid);

    return fmt::format("uuid:{}::{}", identity.uuid, notification_type(identity, target));
}

http::message make_advertisement(const device_identity& identity, const advertisement_target& target,
    std::string_view root_url)
{
    http::message msg {"NOTIFY", "*", "HTTP/1.1"};
    msg.add_header("HOST", fmt::format("{}:{}", SSDP_MULTICAST_IP, SSDP_PORT));
    msg.add_header("cache-control", fmt::format("max-age = {}", SSDP_MAX_AGE));
    msg.add_header("LOCATION", std::string {root_url});
    msg.add_header("NT", notification_type(identity, target));
    msg.add_header("USN", unique_service_name(identity, target));
    msg.add_header("NTS", "ssdp:alive");
    msg.add_header("SERVER", identity.server);
    return msg;
}

http::message make_search_response(const device_identity& identity, std::string_view location,
    std::string_view search_target)
{
    http::message msg {"HTTP/1.1", "200", "OK"};
    msg.add_header("LOCATION", std::string {location});
    msg.add_header("ST", std::string {search_target});
    msg.add_header("USN", fmt::format("uuid:{}::{}", identity.uuid, search_target));
    return msg;
}

} // namespace ssdp

#ifndef SSDP_MESSAGES_HPP
#define SSDP_MESSAGES_HPP

#include <string>
#include <string_view>
#include <vector>

#include "http/message.hpp"
#include "ssdp/device_identity.hpp"

namespace ssdp
{

#define SSDP_MULTICAST_IP "239.255.255.250"
#define SSDP_PORT 1900
#define SSDP_MAX_AGE 900

constexpr std::string_view DIAL_SEARCH_TARGET {"urn:dial-multiscreen-org:service:dial:1"};

enum class advertisement_role
{
    root_device,        /// NT: upnp:rootdevice
    embedded_device,    /// NT: uuid:<device-id>
    device_type,        /// NT: urn:schemas-upnp-org:device:<type>:<version>
    service_type        /// NT: urn:schemas-upnp-org:service:<type>:<version>
};

struct advertisement_target
{
    advertisement_role role;
    std::string type_name;  /// only used by device_type and service_type
    std::string version;
};

/// Root device, the device itself and its Basic:1 device type
std::vector<advertisement_target> default_advertisements();

std::string notification_type(const device_identity& identity, const advertisement_target& target);

std::string unique_service_name(const device_identity& identity, const advertisement_target& target);

/**
 * Builds a "NOTIFY * HTTP/1.1" ssdp:alive message carrying exactly the headers
 * HOST, cache-control, LOCATION, NT, USN, NTS and SERVER in that order.
 *
 * Throws http::invalid_header_value if root_url or the identity contain
 * characters that can not be sent in a header.
 */
http::message make_advertisement(const device_identity& identity, const advertisement_target& target,
    std::string_view root_url);

/// Unicast answer to a matching M-SEARCH with the headers LOCATION, ST and USN
http::message make_search_response(const device_identity& identity, std::string_view location,
    std::string_view search_target);

} // namespace ssdp

#endif

#ifndef DIAL_RESPONDER_CONFIG_HPP
#define DIAL_RESPONDER_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "ssdp/device_identity.hpp"
#include "ssdp/messages.hpp"

#define WEBSERVER_PORT 8081
#define DESCRIPTOR_FILE "./assets/upnp_device_descriptor.xml"

struct config
{
    std::string local_ip;       /// empty means first non-loopback ipv4 address
    uint16_t webserver_port = WEBSERVER_PORT;
    std::string descriptor_file = DESCRIPTOR_FILE;
    std::string multicast_interface = "0.0.0.0";
    ssdp::device_identity identity;
    std::vector<ssdp::advertisement_target> extra_services;
    size_t max_connections = 64;
    std::chrono::seconds io_timeout {5};
    bool verbose = false;
    bool show_help = false;
};

/// Throws std::invalid_argument on unknown options or invalid values
config parse_arguments(int argc, char* const* argv);

std::string usage(std::string_view program);

/// "http://<ip>:<port>/upnp_device_descriptor.xml"
std::string descriptor_location(const config& conf);

#endif

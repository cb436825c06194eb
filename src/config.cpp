#include "config.hpp"
#include "http/message.hpp"
#include "http/request_handler.hpp"

#include "fmt/format.h"

#include <charconv>
#include <limits>
#include <stdexcept>

#include <arpa/inet.h>

template<typename T>
static T parse_number(std::string_view option, std::string_view value, T min, T max)
{
    T result {};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if(ec != std::errc {} || ptr != value.data() + value.size() || result < min || result > max)
        throw std::invalid_argument {fmt::format("Invalid value '{}' for {}", value, option)};
    return result;
}

static std::string parse_ipv4(std::string_view option, std::string_view value)
{
    in_addr tmp;
    std::string addr {value};
    if(inet_pton(AF_INET, addr.c_str(), &tmp) != 1)
        throw std::invalid_argument {fmt::format("Invalid IPv4 address '{}' for {}", value, option)};
    return addr;
}

static ssdp::advertisement_target parse_service(std::string_view value)
{
    size_t sep = value.rfind(':');
    if(sep == std::string_view::npos || sep == 0 || sep + 1 == value.size())
        throw std::invalid_argument {fmt::format("Invalid service '{}', expected NAME:VERSION", value)};

    ssdp::advertisement_target target {ssdp::advertisement_role::service_type,
        std::string {value.substr(0, sep)}, std::string {value.substr(sep + 1)}};
    if(!http::valid_header_value(target.type_name) || target.type_name.find(':') != std::string::npos)
        throw std::invalid_argument {fmt::format("Invalid service name '{}'", target.type_name)};
    return target;
}

config parse_arguments(int argc, char* const* argv)
{
    config conf;

    for(int i = 1; i < argc; ++i)
    {
        std::string_view opt {argv[i]};

        if(opt == "-h" || opt == "--help")
        {
            conf.show_help = true;
            continue;
        }
        if(opt == "-v" || opt == "--verbose")
        {
            conf.verbose = true;
            continue;
        }

        if(i + 1 >= argc)
            throw std::invalid_argument {fmt::format("Missing value for {}", opt)};
        std::string_view value {argv[++i]};

        if(opt == "-a" || opt == "--address")
            conf.local_ip = parse_ipv4(opt, value);
        else if(opt == "-p" || opt == "--port")
            conf.webserver_port = parse_number<uint16_t>(opt, value, 1, std::numeric_limits<uint16_t>::max());
        else if(opt == "-d" || opt == "--descriptor")
            conf.descriptor_file = std::string {value};
        else if(opt == "-u" || opt == "--uuid")
        {
            if(value.empty() || !http::valid_header_value(value))
                throw std::invalid_argument {fmt::format("Invalid uuid '{}'", value)};
            conf.identity.uuid = std::string {value};
        }
        else if(opt == "-i" || opt == "--interface")
            conf.multicast_interface = parse_ipv4(opt, value);
        else if(opt == "-s" || opt == "--service")
            conf.extra_services.push_back(parse_service(value));
        else if(opt == "-c" || opt == "--max-connections")
            conf.max_connections = parse_number<size_t>(opt, value, 1, 4096);
        else if(opt == "-t" || opt == "--timeout")
            conf.io_timeout = std::chrono::seconds {parse_number<long>(opt, value, 1, 3600)};
        else
            throw std::invalid_argument {fmt::format("Unknown option {}", opt)};
    }

    return conf;
}

std::string usage(std::string_view program)
{
    return fmt::format(
        "Usage: {} [options]\n"
        "  -a, --address IP              advertised address (default: first non-loopback ipv4)\n"
        "  -p, --port N                  descriptor webserver port (default: {})\n"
        "  -d, --descriptor FILE         device descriptor document (default: {})\n"
        "  -u, --uuid UUID               device uuid (default: {}), must match the UDN\n"
        "                                in the descriptor document\n"
        "  -i, --interface IP            multicast interface (default: 0.0.0.0)\n"
        "  -s, --service NAME:VERSION    additionally advertise urn:schemas-upnp-org:service:NAME:VERSION\n"
        "  -c, --max-connections N       concurrent webserver connections (default: 64)\n"
        "  -t, --timeout SECONDS         connection read/write timeout (default: 5)\n"
        "  -v, --verbose                 debug logging\n"
        "  -h, --help                    show this help\n",
        program, WEBSERVER_PORT, DESCRIPTOR_FILE, DEFAULT_DEVICE_UUID);
}

std::string descriptor_location(const config& conf)
{
    return fmt::format("http://{}:{}{}", conf.local_ip, conf.webserver_port, DESCRIPTOR_PATH);
}

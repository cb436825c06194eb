#ifndef SSDP_DEVICE_IDENTITY_HPP
#define SSDP_DEVICE_IDENTITY_HPP

#include <string>

namespace ssdp
{

#define DEFAULT_DEVICE_UUID "170ba466-59ac-4039-a457-0fab725b60ff"
#define DEFAULT_SERVER_STRING "Linux UPnP/1.0 dial_responder/1.0"

/// Identity of the advertised root device, fixed for the lifetime of the process
struct device_identity
{
    std::string uuid = DEFAULT_DEVICE_UUID;
    std::string server = DEFAULT_SERVER_STRING;
};

} // namespace ssdp

#endif

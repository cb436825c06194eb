#ifndef SSDP_BROADCASTER_HPP
#define SSDP_BROADCASTER_HPP

#include <chrono>
#include <string_view>
#include <vector>

#include "ssdp/channel.hpp"
#include "ssdp/device_identity.hpp"
#include "ssdp/messages.hpp"

namespace ssdp
{

#define SSDP_PACING_MS 100

struct broadcast_options
{
    std::chrono::milliseconds pacing {SSDP_PACING_MS};
    std::vector<advertisement_target> targets = default_advertisements();
    endpoint group {SSDP_MULTICAST_IP, SSDP_PORT};
};

/**
 * Announces the device by sending one ssdp:alive NOTIFY per target to the
 * multicast group, in order, waiting options.pacing between two sends.
 *
 * A send_error aborts the sequence and is propagated to the caller.
 */
void broadcast(datagram_channel& channel, const device_identity& identity, std::string_view root_url,
    const broadcast_options& options = {});

} // namespace ssdp

#endif

#ifndef SSDP_LISTENER_HPP
#define SSDP_LISTENER_HPP

#include <atomic>
#include <chrono>
#include <string>
#include <string_view>

#include "ssdp/channel.hpp"
#include "ssdp/device_identity.hpp"
#include "ssdp/messages.hpp"

namespace ssdp
{

#define SSDP_POLL_TIMEOUT_MS 500

/// Answers M-SEARCH requests for one search target with a unicast response
class listener
{
public:

    listener() = delete;
    listener(const listener&) = delete;
    listener& operator=(const listener&) = delete;
    listener(listener&&) = default;
    listener& operator=(listener&&) = delete;
    ~listener() = default;

    listener(datagram_channel& channel, device_identity identity, std::string location,
        std::string_view search_target = DIAL_SEARCH_TARGET);

    /**
     * Handles one inbound datagram. Returns true if a response was sent.
     *
     * Malformed datagrams and searches for other targets are dropped. A
     * failed reply throws send_error.
     */
    bool handle_datagram(const datagram& dgram);

    /// Receives until run_condition is cleared. Only a receive_error ends the loop early.
    void listen(const std::atomic<bool>& run_condition);

private:

    datagram_channel& m_channel;

    device_identity m_identity;

    std::string m_location;

    std::string m_search_target;

};

} // namespace ssdp

#endif

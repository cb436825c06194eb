#ifndef SSDP_MULTICAST_CHANNEL_HPP
#define SSDP_MULTICAST_CHANNEL_HPP

#include <string_view>

#include <netinet/in.h>

#include "socketwrapper.hpp"

#include "ssdp/channel.hpp"

namespace ssdp
{

#define SSDP_RECEIVE_BUFFER 8192

/// UDP socket bound to a port that is a member of an IPv4 multicast group
class multicast_channel : public datagram_channel
{
public:

    multicast_channel() = delete;
    multicast_channel(const multicast_channel&) = delete;
    multicast_channel& operator=(const multicast_channel&) = delete;
    multicast_channel(multicast_channel&&) = delete;
    multicast_channel& operator=(multicast_channel&&) = delete;

    /// Throws setup_error
    multicast_channel(std::string_view bind_addr, uint16_t port, std::string_view group,
        std::string_view interface_addr);

    ~multicast_channel() override;

    void send_to(const endpoint& peer, std::string_view payload) override;

    std::optional<datagram> receive(std::chrono::milliseconds timeout) override;

    /// Port the socket is bound to, useful when constructed with port 0
    uint16_t local_port() const;

private:

    static net::udp_socket<net::ip_version::v4> open_socket(std::string_view bind_addr, uint16_t port);

    net::udp_socket<net::ip_version::v4> m_sock;

    ip_mreq m_membership;

};

} // namespace ssdp

#endif

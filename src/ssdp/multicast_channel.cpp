#include "ssdp/multicast_channel.hpp"
#include "logging.hpp"

#include "fmt/format.h"

#include <cerrno>
#include <cstring>
#include <string>
#include <poll.h>
#include <arpa/inet.h>
#include <sys/socket.h>

namespace ssdp
{

static std::string errno_msg(std::string_view what)
{
    return fmt::format("{}: {}", what, std::strerror(errno));
}

static in_addr to_in_addr(std::string_view addr)
{
    in_addr result {};
    if(inet_pton(AF_INET, std::string {addr}.c_str(), &result) != 1)
        throw setup_error {fmt::format("Invalid IPv4 address {}", addr)};
    return result;
}

net::udp_socket<net::ip_version::v4> multicast_channel::open_socket(std::string_view bind_addr, uint16_t port)
{
    try {
        return net::udp_socket<net::ip_version::v4> {bind_addr, port};
    } catch(std::runtime_error& e) {
        throw setup_error {fmt::format("Failed to bind {}:{}: {}", bind_addr, port, e.what())};
    }
}

multicast_channel::multicast_channel(std::string_view bind_addr, uint16_t port, std::string_view group,
    std::string_view interface_addr)
    : m_sock {open_socket(bind_addr, port)},
      m_membership {}
{
    m_membership.imr_multiaddr = to_in_addr(group);
    m_membership.imr_interface = to_in_addr(interface_addr);

    if(setsockopt(m_sock.get(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &m_membership, sizeof(m_membership)) != 0)
        throw setup_error {errno_msg(fmt::format("Failed to join multicast group {}", group))};

    // Receive our own announcements on this host as well
    unsigned char loop = 1;
    if(setsockopt(m_sock.get(), IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) != 0)
        throw setup_error {errno_msg("Failed to enable multicast loopback")};

    if(m_membership.imr_interface.s_addr != htonl(INADDR_ANY))
    {
        if(setsockopt(m_sock.get(), IPPROTO_IP, IP_MULTICAST_IF, &m_membership.imr_interface,
            sizeof(m_membership.imr_interface)) != 0)
            throw setup_error {errno_msg(fmt::format("Failed to select multicast interface {}", interface_addr))};
    }

    logging::info("Joined multicast group {} on {}:{}", group, bind_addr, port);
}

multicast_channel::~multicast_channel()
{
    if(setsockopt(m_sock.get(), IPPROTO_IP, IP_DROP_MEMBERSHIP, &m_membership, sizeof(m_membership)) != 0)
        logging::warn("{}", errno_msg("Failed to leave multicast group"));
}

void multicast_channel::send_to(const endpoint& peer, std::string_view payload)
{
    try {
        m_sock.send(peer.addr, peer.port, net::span {payload.begin(), payload.end()});
    } catch(std::runtime_error& e) {
        throw send_error {fmt::format("Failed to send to {}:{}: {}", peer.addr, peer.port, e.what())};
    }
}

uint16_t multicast_channel::local_port() const
{
    sockaddr_in addr {};
    socklen_t len = sizeof(addr);
    if(getsockname(m_sock.get(), reinterpret_cast<sockaddr*>(&addr), &len) != 0)
        throw transport_error {errno_msg("Unable to get local port")};
    return ntohs(addr.sin_port);
}

std::optional<datagram> multicast_channel::receive(std::chrono::milliseconds timeout)
{
    pollfd pfd {m_sock.get(), POLLIN, 0};
    int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if(ready < 0)
    {
        if(errno == EINTR)
            return std::nullopt;
        throw receive_error {errno_msg("Failed to poll ssdp socket")};
    }
    if(ready == 0)
        return std::nullopt;
    if(pfd.revents & (POLLERR | POLLNVAL))
        throw receive_error {"Ssdp socket is in an error state"};

    try {
        auto [buffer, peer] = m_sock.read<char>(SSDP_RECEIVE_BUFFER);
        return datagram {std::string {buffer.begin(), buffer.end()}, endpoint {peer.addr, peer.port}};
    } catch(std::runtime_error& e) {
        throw receive_error {fmt::format("Failed to receive datagram: {}", e.what())};
    }
}

} // namespace ssdp

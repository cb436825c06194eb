#ifndef SSDP_CHANNEL_HPP
#define SSDP_CHANNEL_HPP

#include <string>
#include <string_view>
#include <optional>
#include <chrono>
#include <stdexcept>
#include <cstdint>

namespace ssdp
{

class transport_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// Socket could not be created, bound or joined to the multicast group
class setup_error : public transport_error
{
public:
    using transport_error::transport_error;
};

class send_error : public transport_error
{
public:
    using transport_error::transport_error;
};

class receive_error : public transport_error
{
public:
    using transport_error::transport_error;
};

struct endpoint
{
    std::string addr;
    uint16_t port;
};

inline bool operator==(const endpoint& lhs, const endpoint& rhs)
{
    return lhs.port == rhs.port && lhs.addr == rhs.addr;
}

struct datagram
{
    std::string payload;
    endpoint peer;
};

/// Datagram transport shared by the broadcaster and the listener
class datagram_channel
{
public:
    virtual ~datagram_channel() = default;

    /// Throws send_error
    virtual void send_to(const endpoint& peer, std::string_view payload) = 0;

    /// Returns std::nullopt if nothing arrived within timeout, throws receive_error
    virtual std::optional<datagram> receive(std::chrono::milliseconds timeout) = 0;
};

} // namespace ssdp

#endif

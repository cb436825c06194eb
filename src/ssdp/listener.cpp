#include "ssdp/listener.hpp"
#include "http/message.hpp"
#include "logging.hpp"

#include <variant>

namespace ssdp
{

listener::listener(datagram_channel& channel, device_identity identity, std::string location,
    std::string_view search_target)
    : m_channel {channel},
      m_identity {std::move(identity)},
      m_location {std::move(location)},
      m_search_target {search_target}
{}

bool listener::handle_datagram(const datagram& dgram)
{
    http::parse_result res = http::parse_message(dgram.payload);
    if(const http::parse_error* err = std::get_if<http::parse_error>(&res))
    {
        logging::debug("Dropping datagram from {}:{}: {}", dgram.peer.addr, dgram.peer.port, http::to_string(*err));
        return false;
    }

    const http::message& msg = std::get<http::message>(res);
    auto st = msg.get_header("ST");
    if(!st || *st != m_search_target)
    {
        logging::debug("Ignoring {} from {}:{} (ST: {})", msg.first(), dgram.peer.addr, dgram.peer.port,
            st ? *st : "none");
        return false;
    }

    std::string reply = make_search_response(m_identity, m_location, m_search_target).to_string();
    m_channel.send_to(dgram.peer, reply);
    logging::info("Answered search from {}:{}", dgram.peer.addr, dgram.peer.port);
    return true;
}

void listener::listen(const std::atomic<bool>& run_condition)
{
    logging::info("Listening for ssdp searches for {}", m_search_target);
    while(run_condition.load())
    {
        std::optional<datagram> dgram = m_channel.receive(std::chrono::milliseconds {SSDP_POLL_TIMEOUT_MS});
        if(!dgram)
            continue;

        try {
            handle_datagram(*dgram);
        } catch(const send_error& e) {
            logging::warn("{}", e.what());
        }
    }
    logging::info("Ssdp listener stopped");
}

} // namespace ssdp

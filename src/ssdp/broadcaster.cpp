#include "ssdp/broadcaster.hpp"
#include "logging.hpp"

#include <thread>

namespace ssdp
{

void broadcast(datagram_channel& channel, const device_identity& identity, std::string_view root_url,
    const broadcast_options& options)
{
    // Build everything first so an invalid header does not leave a half sent announcement
    std::vector<std::string> messages;
    messages.reserve(options.targets.size());
    for(const auto& target : options.targets)
        messages.push_back(make_advertisement(identity, target, root_url).to_string());

    logging::info("Sending {} advertisement(s) to {}:{}", messages.size(), options.group.addr, options.group.port);
    for(size_t i = 0; i < messages.size(); ++i)
    {
        if(i > 0)
            std::this_thread::sleep_for(options.pacing);

        channel.send_to(options.group, messages[i]);
        logging::debug("Sent advertisement {}:\n{}", i + 1, messages[i]);
    }
}

} // namespace ssdp

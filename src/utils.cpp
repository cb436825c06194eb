#include <utils.hpp>

#include <array>
#include <cstdint>
#include <bitset>
#include <memory>
#include <stdexcept>
#include <ifaddrs.h>
#include <sys/socket.h>
#include <netdb.h>
#include <net/if.h>

namespace utils
{

const char* error_msg = "Unable to get local ip address";

std::string get_local_ipaddr()
{
    ifaddrs* addrs;
    if (getifaddrs(&addrs))
        throw std::runtime_error {error_msg};
    std::unique_ptr<ifaddrs, decltype(&freeifaddrs)> guard {addrs, &freeifaddrs};

    for (ifaddrs* curr_addr = addrs; curr_addr != nullptr; curr_addr = curr_addr->ifa_next)
    {
        // Only IPv4 is advertised over SSDP here
        if(curr_addr->ifa_addr == nullptr || curr_addr->ifa_addr->sa_family != AF_INET)
            continue;

        std::bitset<sizeof(unsigned int) * 8> flags {curr_addr->ifa_flags};
        if (!flags.test(IFF_UP) || flags.test(IFF_LOOPBACK))
            continue;

        std::array<char, NI_MAXHOST> host;
        int s = getnameinfo(curr_addr->ifa_addr, sizeof(sockaddr_in),
            host.data(), NI_MAXHOST, nullptr, 0, NI_NUMERICHOST);
        if(s != 0)
            throw std::runtime_error {error_msg};

        return host.data();
    }

    throw std::runtime_error {error_msg};
}

bool is_valid_utf8(std::string_view text)
{
    size_t i = 0;
    while(i < text.size())
    {
        const auto lead = static_cast<unsigned char>(text[i]);

        size_t len;
        uint32_t cp;
        if(lead < 0x80)
        {
            ++i;
            continue;
        }
        else if((lead & 0xE0) == 0xC0)
        {
            len = 2;
            cp = lead & 0x1F;
        }
        else if((lead & 0xF0) == 0xE0)
        {
            len = 3;
            cp = lead & 0x0F;
        }
        else if((lead & 0xF8) == 0xF0)
        {
            len = 4;
            cp = lead & 0x07;
        }
        else
        {
            return false;
        }

        if(i + len > text.size())
            return false;

        for(size_t k = 1; k < len; ++k)
        {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if((cont & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (cont & 0x3F);
        }

        // Reject overlong encodings, surrogates and values past U+10FFFF
        if((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
            return false;
        if((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
            return false;

        i += len;
    }

    return true;
}

static char ascii_lower(char c)
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool iequals(std::string_view lhs, std::string_view rhs)
{
    if(lhs.size() != rhs.size())
        return false;

    for(size_t i = 0; i < lhs.size(); ++i)
    {
        if(ascii_lower(lhs[i]) != ascii_lower(rhs[i]))
            return false;
    }
    return true;
}

std::string_view trim(std::string_view view)
{
    while(!view.empty() && (view.front() == ' ' || view.front() == '\t'))
        view.remove_prefix(1);
    while(!view.empty() && (view.back() == ' ' || view.back() == '\t'))
        view.remove_suffix(1);
    return view;
}

} // utils

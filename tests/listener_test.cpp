#include <gtest/gtest.h>

#include "fake_channel.hpp"
#include "http/message.hpp"
#include "ssdp/listener.hpp"

#include <atomic>

using namespace ssdp;
using testing_support::fake_channel;

namespace
{

const device_identity identity {"170ba466-59ac-4039-a457-0fab725b60ff", "Linux UPnP/1.0 dial_responder/1.0"};
const std::string location {"http://10.0.0.2:8081/upnp_device_descriptor.xml"};
const endpoint requester {"10.0.0.5", 51000};

std::string search(std::string_view st)
{
    return "M-SEARCH * HTTP/1.1\r\nHOST: 239.255.255.250:1900\r\nST: " + std::string {st} + "\r\n\r\n";
}

} // namespace

TEST(ListenerTest, AnswersDialSearchWithUnicastReply)
{
    fake_channel channel;
    listener l {channel, identity, location};

    EXPECT_TRUE(l.handle_datagram(datagram {search("urn:dial-multiscreen-org:service:dial:1"), requester}));

    ASSERT_EQ(channel.sends.size(), 1u);
    EXPECT_EQ(channel.sends[0].peer, requester);
    EXPECT_NE(channel.sends[0].payload.find("ST: urn:dial-multiscreen-org:service:dial:1\r\n"), std::string::npos);

    http::parse_result res = http::parse_message(channel.sends[0].payload);
    ASSERT_TRUE(std::holds_alternative<http::message>(res));
    const http::message& reply = std::get<http::message>(res);
    EXPECT_EQ(reply.first(), "HTTP/1.1");
    EXPECT_EQ(reply.second(), "200");
    EXPECT_EQ(reply.third(), "OK");
    EXPECT_EQ(*reply.get_header("LOCATION"), location);
}

TEST(ListenerTest, IgnoresOtherSearchTargets)
{
    fake_channel channel;
    listener l {channel, identity, location};

    EXPECT_FALSE(l.handle_datagram(datagram {search("upnp:rootdevice"), requester}));
    EXPECT_FALSE(l.handle_datagram(datagram {search("ssdp:all"), requester}));
    EXPECT_FALSE(l.handle_datagram(datagram {search("urn:dial-multiscreen-org:service:dial:10"), requester}));
    EXPECT_TRUE(channel.sends.empty());
}

TEST(ListenerTest, IgnoresSearchWithoutSearchTarget)
{
    fake_channel channel;
    listener l {channel, identity, location};

    EXPECT_FALSE(l.handle_datagram(datagram {
        "M-SEARCH * HTTP/1.1\r\nHOST: 239.255.255.250:1900\r\nMAN: \"ssdp:discover\"\r\n\r\n", requester}));
    EXPECT_TRUE(channel.sends.empty());
}

TEST(ListenerTest, DropsMalformedDatagrams)
{
    fake_channel channel;
    listener l {channel, identity, location};

    EXPECT_FALSE(l.handle_datagram(datagram {"\xFF\xFE\xFD", requester}));
    EXPECT_FALSE(l.handle_datagram(datagram {"M-SEARCH *\r\nST: urn:dial-multiscreen-org:service:dial:1\r\n\r\n",
        requester}));
    EXPECT_FALSE(l.handle_datagram(datagram {"", requester}));
    EXPECT_TRUE(channel.sends.empty());
}

TEST(ListenerTest, SkipsMalformedHeaderLinesAndStillMatches)
{
    fake_channel channel;
    listener l {channel, identity, location};

    EXPECT_TRUE(l.handle_datagram(datagram {
        "M-SEARCH * HTTP/1.1\r\ngarbage line\r\nST: urn:dial-multiscreen-org:service:dial:1\r\n\r\n", requester}));
    EXPECT_EQ(channel.sends.size(), 1u);
}

TEST(ListenerTest, ReplyFailurePropagatesFromHandleDatagram)
{
    fake_channel channel;
    channel.fail_sends = true;
    listener l {channel, identity, location};

    EXPECT_THROW(l.handle_datagram(datagram {search("urn:dial-multiscreen-org:service:dial:1"), requester}),
        send_error);
}

TEST(ListenerTest, LoopSurvivesMalformedInputAndTimeouts)
{
    fake_channel channel;
    channel.queue("\xC0\xAF", requester);
    channel.queue("NOT-HTTP\r\n\r\n", requester);
    channel.queue_timeout();
    channel.queue(search("upnp:rootdevice"), requester);
    channel.queue(search("urn:dial-multiscreen-org:service:dial:1"), endpoint {"10.0.0.7", 40000});

    listener l {channel, identity, location};
    std::atomic<bool> run_condition {true};

    // The drained fake reports a receive failure, which is the only way out of the loop
    EXPECT_THROW(l.listen(run_condition), receive_error);

    ASSERT_EQ(channel.sends.size(), 1u);
    EXPECT_EQ(channel.sends[0].peer, (endpoint {"10.0.0.7", 40000}));
}

TEST(ListenerTest, LoopContinuesAfterFailedReply)
{
    fake_channel channel;
    channel.fail_sends = true;
    channel.queue(search("urn:dial-multiscreen-org:service:dial:1"), requester);
    channel.queue(search("urn:dial-multiscreen-org:service:dial:1"), requester);

    listener l {channel, identity, location};
    std::atomic<bool> run_condition {true};

    EXPECT_THROW(l.listen(run_condition), receive_error);
    EXPECT_TRUE(channel.inbound.empty());
}

TEST(ListenerTest, LoopStopsWhenRunConditionIsCleared)
{
    fake_channel channel;
    channel.queue(search("urn:dial-multiscreen-org:service:dial:1"), requester);

    listener l {channel, identity, location};
    std::atomic<bool> run_condition {false};

    EXPECT_NO_THROW(l.listen(run_condition));
    EXPECT_TRUE(channel.sends.empty());
    EXPECT_EQ(channel.inbound.size(), 1u);
}

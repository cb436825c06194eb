#include <gtest/gtest.h>

#include "config.hpp"

#include <stdexcept>
#include <vector>

namespace
{

config parse(std::vector<const char*> args)
{
    args.insert(args.begin(), "dial_responder");
    return parse_arguments(static_cast<int>(args.size()), const_cast<char* const*>(args.data()));
}

} // namespace

TEST(ConfigTest, Defaults)
{
    config conf = parse({});

    EXPECT_TRUE(conf.local_ip.empty());
    EXPECT_EQ(conf.webserver_port, 8081);
    EXPECT_EQ(conf.descriptor_file, "./assets/upnp_device_descriptor.xml");
    EXPECT_EQ(conf.multicast_interface, "0.0.0.0");
    EXPECT_EQ(conf.identity.uuid, "170ba466-59ac-4039-a457-0fab725b60ff");
    EXPECT_TRUE(conf.extra_services.empty());
    EXPECT_EQ(conf.max_connections, 64u);
    EXPECT_EQ(conf.io_timeout, std::chrono::seconds {5});
    EXPECT_FALSE(conf.verbose);
    EXPECT_FALSE(conf.show_help);
}

TEST(ConfigTest, ParsesAllOptions)
{
    config conf = parse({"-a", "192.168.178.9", "--port", "9000", "-d", "/tmp/desc.xml", "--uuid", "abc-123",
        "-i", "192.168.178.9", "-s", "RenderingControl:1", "--service", "AVTransport:2",
        "-c", "8", "--timeout", "30", "-v"});

    EXPECT_EQ(conf.local_ip, "192.168.178.9");
    EXPECT_EQ(conf.webserver_port, 9000);
    EXPECT_EQ(conf.descriptor_file, "/tmp/desc.xml");
    EXPECT_EQ(conf.identity.uuid, "abc-123");
    EXPECT_EQ(conf.multicast_interface, "192.168.178.9");
    ASSERT_EQ(conf.extra_services.size(), 2u);
    EXPECT_EQ(conf.extra_services[0].role, ssdp::advertisement_role::service_type);
    EXPECT_EQ(conf.extra_services[0].type_name, "RenderingControl");
    EXPECT_EQ(conf.extra_services[0].version, "1");
    EXPECT_EQ(conf.extra_services[1].type_name, "AVTransport");
    EXPECT_EQ(conf.extra_services[1].version, "2");
    EXPECT_EQ(conf.max_connections, 8u);
    EXPECT_EQ(conf.io_timeout, std::chrono::seconds {30});
    EXPECT_TRUE(conf.verbose);
}

TEST(ConfigTest, Help)
{
    EXPECT_TRUE(parse({"--help"}).show_help);
    EXPECT_NE(usage("dial_responder").find("--descriptor"), std::string::npos);
    EXPECT_NE(usage("dial_responder").find("must match the UDN"), std::string::npos);
}

TEST(ConfigTest, RejectsInvalidValues)
{
    EXPECT_THROW(parse({"--port", "0"}), std::invalid_argument);
    EXPECT_THROW(parse({"--port", "70000"}), std::invalid_argument);
    EXPECT_THROW(parse({"--port", "80a"}), std::invalid_argument);
    EXPECT_THROW(parse({"--address", "not-an-ip"}), std::invalid_argument);
    EXPECT_THROW(parse({"--address", "::1"}), std::invalid_argument);
    EXPECT_THROW(parse({"--service", "NoVersion"}), std::invalid_argument);
    EXPECT_THROW(parse({"--service", ":1"}), std::invalid_argument);
    EXPECT_THROW(parse({"--uuid", "\xC3\xA4"}), std::invalid_argument);
    EXPECT_THROW(parse({"--timeout", "0"}), std::invalid_argument);
}

TEST(ConfigTest, RejectsUnknownOptionAndMissingValue)
{
    EXPECT_THROW(parse({"--bogus", "1"}), std::invalid_argument);
    EXPECT_THROW(parse({"--port"}), std::invalid_argument);
}

TEST(ConfigTest, DescriptorLocation)
{
    config conf = parse({"-a", "10.0.0.2", "-p", "8081"});

    EXPECT_EQ(descriptor_location(conf), "http://10.0.0.2:8081/upnp_device_descriptor.xml");
}

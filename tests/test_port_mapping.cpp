#include <gtest/gtest.h>
#include <core/port_mapping.hpp>

TEST(PortMapping, ParseIPv4) {
    auto r = PortMapping::parse("127.0.0.1:7070:8080");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.address, "127.0.0.1");
    EXPECT_EQ(r.value.local_port, 7070);
    EXPECT_EQ(r.value.container_port, 8080);
}

TEST(PortMapping, ParseIPv6WithAndWithoutBrackets) {
    auto bare = PortMapping::parse("::1:7070:8080");
    ASSERT_TRUE(bare.is_ok()) << bare.error;
    EXPECT_EQ(bare.value.address, "::1");

    auto bracketed = PortMapping::parse("[::1]:7070:8080");
    ASSERT_TRUE(bracketed.is_ok()) << bracketed.error;
    EXPECT_EQ(bracketed.value, bare.value);
}

TEST(PortMapping, ParseAnyAddress) {
    auto r = PortMapping::parse("0.0.0.0:0:22");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.local_port, 0);
    EXPECT_EQ(r.value.container_port, 22);
}

TEST(PortMapping, ParseRejectsMissingParts) {
    auto r = PortMapping::parse("7070:8080");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Invalid format"), std::string::npos);

    EXPECT_TRUE(PortMapping::parse("8080").is_err());
    EXPECT_TRUE(PortMapping::parse("").is_err());
}

TEST(PortMapping, ParseRejectsBadPorts) {
    auto big = PortMapping::parse("127.0.0.1:70000:80");
    ASSERT_TRUE(big.is_err());
    EXPECT_EQ(big.error, "Invalid port value '70000'");

    auto neg = PortMapping::parse("127.0.0.1:7070:-1");
    ASSERT_TRUE(neg.is_err());
    EXPECT_EQ(neg.error, "Invalid port value '-1'");

    EXPECT_TRUE(PortMapping::parse("127.0.0.1:abc:80").is_err());
    EXPECT_TRUE(PortMapping::parse("127.0.0.1:7070:").is_err());
}

TEST(PortMapping, ParseRejectsHostnames) {
    auto r = PortMapping::parse("localhost:7070:8080");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "Invalid IP address 'localhost'");

    EXPECT_TRUE(PortMapping::parse(":7070:8080").is_err());
    EXPECT_TRUE(PortMapping::parse("300.1.1.1:7070:8080").is_err());
}

TEST(PortMapping, ToString) {
    auto v4 = PortMapping::parse("127.0.0.1:7070:8080").value;
    EXPECT_EQ(v4.to_string(), "127.0.0.1:7070:8080");

    auto v6 = PortMapping::parse("::1:7070:8080").value;
    EXPECT_EQ(v6.to_string(), "[::1]:7070:8080");
    EXPECT_EQ(PortMapping::parse(v6.to_string()).value, v6);
}

TEST(PortMapping, ParsePort) {
    uint16_t port = 1;
    EXPECT_TRUE(parse_port("0", port));
    EXPECT_EQ(port, 0);
    EXPECT_TRUE(parse_port("65535", port));
    EXPECT_EQ(port, 65535);
    EXPECT_FALSE(parse_port("65536", port));
    EXPECT_FALSE(parse_port("+80", port));
    EXPECT_FALSE(parse_port("80 ", port));
    EXPECT_FALSE(parse_port("", port));
}

TEST(PortMapping, FormatHostPort) {
    EXPECT_EQ(format_host_port("10.0.0.1", 80), "10.0.0.1:80");
    EXPECT_EQ(format_host_port("fe80::1", 443), "[fe80::1]:443");
}

#include <gtest/gtest.h>
#include "ip_address.hpp"
#include "guard_errors.hpp"
#include <algorithm>
#include <vector>

TEST(IpAddressTest, AcceptsDottedQuads) {
    EXPECT_TRUE(ip_address::is_valid_ipv4("203.0.113.7"));
    EXPECT_TRUE(ip_address::is_valid_ipv4("0.0.0.0"));
    EXPECT_TRUE(ip_address::is_valid_ipv4("255.255.255.255"));
    EXPECT_TRUE(ip_address::is_valid_ipv4("10.0.0.5"));
}

TEST(IpAddressTest, RejectsMalformedAddresses) {
    EXPECT_FALSE(ip_address::is_valid_ipv4(""));
    EXPECT_FALSE(ip_address::is_valid_ipv4("999.1.1.1"));
    EXPECT_FALSE(ip_address::is_valid_ipv4("256.0.0.1"));
    EXPECT_FALSE(ip_address::is_valid_ipv4("1.2.3"));
    EXPECT_FALSE(ip_address::is_valid_ipv4("1.2.3.4.5"));
    EXPECT_FALSE(ip_address::is_valid_ipv4("010.0.0.1"));
    EXPECT_FALSE(ip_address::is_valid_ipv4(" 1.2.3.4"));
    EXPECT_FALSE(ip_address::is_valid_ipv4("1.2.3.4/32"));
    EXPECT_FALSE(ip_address::is_valid_ipv4("2001:db8::1"));
    EXPECT_FALSE(ip_address::is_valid_ipv4("1.2.3.4; rm -rf /"));
}

TEST(IpAddressTest, RequireThrowsValidationError) {
    EXPECT_EQ(ip_address::require_ipv4("198.51.100.9"), "198.51.100.9");
    EXPECT_THROW(ip_address::require_ipv4("not-an-ip"), ValidationError);
    EXPECT_THROW(ip_address::require_ipv4("300.1.1.1"), ValidationError);
}

TEST(IpAddressTest, ExtractsAddressFromVncLogLine) {
    auto ip = ip_address::extract_first_ipv4(
        "Wed Oct 18 10:01:02 2026 Connections: authentication failed from 203.0.113.7");
    ASSERT_TRUE(ip.has_value());
    EXPECT_EQ(*ip, "203.0.113.7");

    auto with_port = ip_address::extract_first_ipv4("VNCSConnST: Client 198.51.100.9::51234 authentication failed");
    ASSERT_TRUE(with_port.has_value());
    EXPECT_EQ(*with_port, "198.51.100.9");
}

TEST(IpAddressTest, AllowsTrailingSentenceDot) {
    auto ip = ip_address::extract_first_ipv4("authentication failed for 192.0.2.44.");
    ASSERT_TRUE(ip.has_value());
    EXPECT_EQ(*ip, "192.0.2.44");
}

TEST(IpAddressTest, SkipsInvalidOctetsAndContinues) {
    auto ip = ip_address::extract_first_ipv4("authentication failed 999.1.1.1 then 192.0.2.1");
    ASSERT_TRUE(ip.has_value());
    EXPECT_EQ(*ip, "192.0.2.1");
}

TEST(IpAddressTest, IgnoresLongerDottedTokens) {
    EXPECT_FALSE(ip_address::extract_first_ipv4("version 1.2.3.4.5 authentication failed").has_value());
    EXPECT_FALSE(ip_address::extract_first_ipv4("host a1.2.3.4 authentication failed").has_value());
}

TEST(IpAddressTest, NoAddressInLine) {
    EXPECT_FALSE(ip_address::extract_first_ipv4("").has_value());
    EXPECT_FALSE(ip_address::extract_first_ipv4("authentication failed").has_value());
    EXPECT_FALSE(ip_address::extract_first_ipv4("authentication failed from 999.999.999.999").has_value());
}

TEST(IpAddressTest, NumericOrdering) {
    std::vector<std::string> addresses = {"10.0.0.10", "9.255.255.255", "10.0.0.9", "192.168.1.1"};
    std::sort(addresses.begin(), addresses.end(), ip_address::numeric_less);

    std::vector<std::string> expected = {"9.255.255.255", "10.0.0.9", "10.0.0.10", "192.168.1.1"};
    EXPECT_EQ(addresses, expected);
    EXPECT_EQ(ip_address::to_host_order("1.0.0.2"), 0x01000002u);
}

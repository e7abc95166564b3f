#include "motd/net/address.hpp"

#include <gtest/gtest.h>

#include <netinet/in.h>

using motd::MotdError;
using motd::MotdErrorCode;
using motd::net::ParseHostPort;
using motd::net::ResolveDatagramTarget;

TEST(ParseHostPortTest, HostOnlyUsesDefaultPort) {
    const auto parsed = ParseHostPort("play.example.net", 19132);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->host, "play.example.net");
    EXPECT_EQ(parsed->port, 19132);
}

TEST(ParseHostPortTest, HostAndPort) {
    const auto parsed = ParseHostPort("127.0.0.1:19133", 19132);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->host, "127.0.0.1");
    EXPECT_EQ(parsed->port, 19133);
}

TEST(ParseHostPortTest, BracketedIpv6) {
    auto parsed = ParseHostPort("[::1]:19133", 19132);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->host, "::1");
    EXPECT_EQ(parsed->port, 19133);

    parsed = ParseHostPort("[::1]", 19132);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->port, 19132);
}

TEST(ParseHostPortTest, BareIpv6IsHostOnly) {
    const auto parsed = ParseHostPort("fe80::1", 19132);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->host, "fe80::1");
    EXPECT_EQ(parsed->port, 19132);
}

TEST(ParseHostPortTest, RejectsMalformedAddresses) {
    EXPECT_FALSE(ParseHostPort("", 19132).has_value());
    EXPECT_FALSE(ParseHostPort(":19132", 19132).has_value());
    EXPECT_FALSE(ParseHostPort("host:", 19132).has_value());
    EXPECT_FALSE(ParseHostPort("host:port", 19132).has_value());
    EXPECT_FALSE(ParseHostPort("host:70000", 19132).has_value());
    EXPECT_FALSE(ParseHostPort("host:0", 19132).has_value());
    EXPECT_FALSE(ParseHostPort("[::1", 19132).has_value());
    EXPECT_FALSE(ParseHostPort("[]:1", 19132).has_value());
    EXPECT_FALSE(ParseHostPort("[::1]19132", 19132).has_value());
}

TEST(ResolveDatagramTargetTest, NumericLoopback) {
    MotdError error;
    const auto target = ResolveDatagramTarget("127.0.0.1:19135", 19132, &error);
    ASSERT_TRUE(target.has_value()) << error.message;
    EXPECT_EQ(target->family, AF_INET);
    EXPECT_EQ(motd::net::FormatSockaddr(target->address), "127.0.0.1:19135");
}

TEST(ResolveDatagramTargetTest, InvalidAddressIsSendFailure) {
    MotdError error;
    EXPECT_FALSE(ResolveDatagramTarget("127.0.0.1:notaport", 19132, &error).has_value());
    EXPECT_EQ(error.code, MotdErrorCode::CantSendTo);
}

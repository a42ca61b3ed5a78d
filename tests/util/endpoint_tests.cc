#include "util/endpoint.h"
#include <gtest/gtest.h>

using util::parse_endpoint;

TEST(EndpointTest, HostOnlyUsesDefaultPort) {
    const auto endpoint = parse_endpoint("vault.example.com");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->host, "vault.example.com");
    EXPECT_EQ(endpoint->port, util::kDefaultServicePort);
    EXPECT_TRUE(endpoint->scheme.empty());
}

TEST(EndpointTest, SchemePortAndPath) {
    const auto endpoint = parse_endpoint("  HTTPS://notes.local:9000/api/sync  ");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->scheme, "https");
    EXPECT_EQ(endpoint->host, "notes.local");
    EXPECT_EQ(endpoint->port, 9000);
    EXPECT_EQ(endpoint->to_string(), "https://notes.local:9000");
}

TEST(EndpointTest, BracketedIpv6) {
    const auto endpoint = parse_endpoint("ws://[::1]:4100");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->host, "::1");
    EXPECT_EQ(endpoint->port, 4100);
    EXPECT_EQ(endpoint->to_string(), "ws://[::1]:4100");
}

TEST(EndpointTest, RejectsMalformedInput) {
    EXPECT_FALSE(parse_endpoint("").has_value());
    EXPECT_FALSE(parse_endpoint("ftp://host").has_value());
    EXPECT_FALSE(parse_endpoint("host:").has_value());
    EXPECT_FALSE(parse_endpoint("host:0").has_value());
    EXPECT_FALSE(parse_endpoint("host:70000").has_value());
    EXPECT_FALSE(parse_endpoint("host:12ab").has_value());
    EXPECT_FALSE(parse_endpoint("::1").has_value());
    EXPECT_FALSE(parse_endpoint("[::1").has_value());
    EXPECT_FALSE(parse_endpoint("tcp:///path").has_value());
}

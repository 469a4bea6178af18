/**
 * @file test_ip_address.cpp
 * @brief Tests for address syntax checks and IPv6 global-routability filtering.
 */
#include <gtest/gtest.h>

#include "ip_address.hpp"

using namespace wanwatch;

// ---------- IPv4 ----------

TEST(Ipv4, ValidDottedQuad) {
  EXPECT_TRUE(is_valid_ipv4("203.0.113.5"));
  EXPECT_TRUE(is_valid_ipv4("0.0.0.0"));
  EXPECT_FALSE(is_valid_ipv4("256.1.1.1"));
  EXPECT_FALSE(is_valid_ipv4("1.2.3"));
  EXPECT_FALSE(is_valid_ipv4("2001:db8::1"));
  EXPECT_FALSE(is_valid_ipv4(""));
}

TEST(Ipv4, LooksLikeOnlyNeedsADot) {
  EXPECT_TRUE(looks_like_ipv4("1.2.3.4"));
  EXPECT_TRUE(looks_like_ipv4("a.b"));
  EXPECT_FALSE(looks_like_ipv4("2606:4700::1111"));
}

// ---------- IPv6 ----------

TEST(Ipv6, SyntaxAndZoneIds) {
  EXPECT_TRUE(is_valid_ipv6("2606:4700:4700::1111"));
  EXPECT_TRUE(is_valid_ipv6("::1"));
  EXPECT_FALSE(is_valid_ipv6("fe80::1%eth0"));
  EXPECT_FALSE(is_valid_ipv6("1.2.3.4"));
  EXPECT_FALSE(is_valid_ipv6("not-an-address"));
}

TEST(Ipv6, GlobalUnicastAccepted) {
  EXPECT_TRUE(is_globally_routable("2606:4700:4700::1111"));
  EXPECT_TRUE(is_globally_routable("2a00:1450:4001:82a::200e"));
  EXPECT_TRUE(is_globally_routable("2001:4860:4860::8888"));
}

TEST(Ipv6, DocumentationPrefixAccepted) {
  EXPECT_TRUE(is_globally_routable("2001:db8::1"));
  EXPECT_TRUE(is_globally_routable("2001:db8::2"));
  EXPECT_TRUE(is_globally_routable("2001:db8::8a2e:370:7334"));
  EXPECT_TRUE(is_globally_routable("2001:0db8:85a3:0000:0000:8a2e:0370:7334"));
  EXPECT_TRUE(is_globally_routable("2001:0:4136:e378::1"));
}

TEST(Ipv6, NonGlobalRangesRejected) {
  EXPECT_FALSE(is_globally_routable("::1"));                 // loopback
  EXPECT_FALSE(is_globally_routable("::"));                  // unspecified
  EXPECT_FALSE(is_globally_routable("fe80::1"));             // link-local
  EXPECT_FALSE(is_globally_routable("fd12:3456:789a::1"));   // unique-local
  EXPECT_FALSE(is_globally_routable("fd00::1"));             // unique-local
  EXPECT_FALSE(is_globally_routable("ff02::1"));             // multicast
  EXPECT_FALSE(is_globally_routable("::ffff:192.0.2.1"));    // IPv4-mapped
}

TEST(Ipv6, MalformedIsNotRoutable) {
  EXPECT_FALSE(is_globally_routable("2001:db8::g"));
  EXPECT_FALSE(is_globally_routable("203.0.113.5"));
  EXPECT_FALSE(is_globally_routable(""));
}

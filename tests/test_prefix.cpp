/**
 * @file test_prefix.cpp
 * @brief Tests for IpPrefix parsing, canonical form and containment.
 */
#include <gtest/gtest.h>

#include "rpkiv/net/ip_prefix.hpp"

using rpkiv::net::Family;
using rpkiv::net::IpPrefix;
using rpkiv::net::PrefixError;

TEST(IpPrefix, Parse_V4AndV6) {
  auto a = IpPrefix::parse("10.0.0.0/8");
  ASSERT_TRUE(a);
  EXPECT_EQ(a->family, Family::V4);
  EXPECT_EQ(a->length, 8);
  EXPECT_EQ(a->to_string(), "10.0.0.0/8");

  auto b = IpPrefix::parse("2001:db8::/32");
  ASSERT_TRUE(b);
  EXPECT_EQ(b->family, Family::V6);
  EXPECT_EQ(b->width(), 128);
  EXPECT_EQ(b->to_string(), "2001:db8::/32");
}

TEST(IpPrefix, Parse_BareAddressIsHostPrefix) {
  EXPECT_EQ(IpPrefix::parse("192.0.2.1")->length, 32);
  EXPECT_EQ(IpPrefix::parse("::1")->length, 128);
}

TEST(IpPrefix, Parse_ClearsHostBits) {
  auto p = IpPrefix::parse("10.1.2.3/16");
  ASSERT_TRUE(p);
  EXPECT_EQ(p->to_string(), "10.1.0.0/16");
  EXPECT_EQ(*p, IpPrefix::v4(0x0A010000u, 16));
}

TEST(IpPrefix, Parse_Errors) {
  EXPECT_EQ(IpPrefix::parse("10.0.0/8").error(), PrefixError::BadAddress);
  EXPECT_EQ(IpPrefix::parse("nonsense").error(), PrefixError::BadAddress);
  EXPECT_EQ(IpPrefix::parse("10.0.0.0/").error(), PrefixError::BadLength);
  EXPECT_EQ(IpPrefix::parse("10.0.0.0/8x").error(), PrefixError::BadLength);
  EXPECT_EQ(IpPrefix::parse("10.0.0.0/33").error(), PrefixError::LengthRange);
  EXPECT_EQ(IpPrefix::parse("2001:db8::/129").error(), PrefixError::LengthRange);
}

TEST(IpPrefix, Covers) {
  const auto p8  = *IpPrefix::parse("10.0.0.0/8");
  const auto p16 = *IpPrefix::parse("10.1.0.0/16");
  const auto o16 = *IpPrefix::parse("11.1.0.0/16");
  const auto v6  = *IpPrefix::parse("::/0");
  EXPECT_TRUE(p8.covers(p16));
  EXPECT_TRUE(p8.covers(p8));
  EXPECT_FALSE(p16.covers(p8));
  EXPECT_FALSE(p8.covers(o16));
  EXPECT_FALSE(v6.covers(p8));  // families never cover each other
}

TEST(IpPrefix, BitsAndTruncation) {
  const auto p = *IpPrefix::parse("128.0.0.0/1");
  EXPECT_TRUE(p.bit(0));
  EXPECT_FALSE(p.bit(1));
  const auto q = IpPrefix::parse("10.255.0.0/16")->truncated(8);
  EXPECT_EQ(q.to_string(), "10.0.0.0/8");
  // Truncating to a longer length keeps the original length.
  EXPECT_EQ(q.truncated(24).length, 8);
}

TEST(IpPrefix, Ordering) {
  const auto a = *IpPrefix::parse("10.0.0.0/8");
  const auto b = *IpPrefix::parse("10.0.0.0/9");
  const auto c = *IpPrefix::parse("11.0.0.0/8");
  EXPECT_LT(a, b);
  EXPECT_LT(b, c);
  EXPECT_LT(c, *IpPrefix::parse("::/0"));  // V4 sorts before V6
}

TEST(NumberArgs, ParseAsn) {
  EXPECT_EQ(rpkiv::net::parse_asn("64500"), 64500u);
  EXPECT_EQ(rpkiv::net::parse_asn("AS64500"), 64500u);
  EXPECT_EQ(rpkiv::net::parse_asn("as4294967295"), 4294967295u);
  EXPECT_FALSE(rpkiv::net::parse_asn("4294967296"));
  EXPECT_FALSE(rpkiv::net::parse_asn("-1"));
  EXPECT_FALSE(rpkiv::net::parse_asn("645x"));
  EXPECT_FALSE(rpkiv::net::parse_asn("AS"));
  EXPECT_FALSE(rpkiv::net::parse_asn(""));
}

TEST(NumberArgs, ParsePortRejectsOutOfRange) {
  EXPECT_EQ(rpkiv::net::parse_port("323"), 323);
  EXPECT_EQ(rpkiv::net::parse_port("65535"), 65535);
  EXPECT_FALSE(rpkiv::net::parse_port("65536"));
  EXPECT_FALSE(rpkiv::net::parse_port("70000"));
  EXPECT_FALSE(rpkiv::net::parse_port("0"));
  EXPECT_FALSE(rpkiv::net::parse_port("abc"));
  EXPECT_FALSE(rpkiv::net::parse_port(" 323"));
}

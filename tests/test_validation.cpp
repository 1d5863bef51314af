/**
 * @file test_validation.cpp
 * @brief Tests for route origin validation (Valid / NotFound / Invalid).
 */
#include <gtest/gtest.h>

#include <cstdint>
#include <initializer_list>
#include <utility>
#include <vector>

#include "rpkiv/net/ip_prefix.hpp"
#include "rpkiv/vrp/validation.hpp"
#include "rpkiv/vrp/vrp_table.hpp"

using rpkiv::net::IpPrefix;
using rpkiv::vrp::EditErr;
using rpkiv::vrp::Validity;
using rpkiv::vrp::Vrp;
using rpkiv::vrp::VrpTable;
using rpkiv::vrp::validate;
using rpkiv::vrp::validity;

namespace {

IpPrefix pfx(const char* s) { return *IpPrefix::parse(s); }

std::shared_ptr<const VrpTable> table_of(std::initializer_list<Vrp> vrps) {
  VrpTable::Editor ed;
  for (const auto& v : vrps) EXPECT_EQ(ed.announce(v), EditErr::Ok);
  return std::move(ed).commit(1, 1);
}

} // namespace

TEST(Validation, ReferenceScenario) {
  auto t = table_of({Vrp{pfx("10.0.0.0/8"), 24, 65001}});
  EXPECT_EQ(validate(*t, pfx("10.1.0.0/16"), 65001).state, Validity::Valid);
  EXPECT_EQ(validate(*t, pfx("10.1.0.0/25"), 65001).state, Validity::Invalid);   // beyond max-length
  EXPECT_EQ(validate(*t, pfx("10.1.0.0/16"), 65002).state, Validity::Invalid);   // wrong origin
  EXPECT_EQ(validate(*t, pfx("11.0.0.0/16"), 65001).state, Validity::NotFound);  // not covered
}

TEST(Validation, FastPathAgreesWithDiagnostics) {
  auto t = table_of({Vrp{pfx("10.0.0.0/8"), 24, 65001}, Vrp{pfx("10.1.0.0/16"), 16, 65002},
                     Vrp{pfx("2001:db8::/32"), 48, 65003}});
  const std::vector<std::pair<const char*, std::uint32_t>> routes = {
      {"10.1.0.0/16", 65001}, {"10.1.0.0/16", 65002}, {"10.1.0.0/24", 65002}, {"10.1.0.0/16", 1},
      {"12.0.0.0/8", 65001},  {"2001:db8::/48", 65003}, {"2001:db8::/64", 65003}, {"2001:db9::/32", 65003}};
  for (const auto& [r, asn] : routes) {
    EXPECT_EQ(validity(*t, pfx(r), asn), validate(*t, pfx(r), asn).state) << r << " AS" << asn;
  }
}

TEST(Validation, ReportsMatchedAndUnmatched) {
  auto t = table_of({Vrp{pfx("10.0.0.0/8"), 8, 65001}, Vrp{pfx("10.1.0.0/16"), 24, 65001},
                     Vrp{pfx("10.1.0.0/16"), 24, 65002}});
  const auto r = validate(*t, pfx("10.1.2.0/24"), 65001);
  EXPECT_EQ(r.state, Validity::Valid);
  ASSERT_EQ(r.matched.size(), 1u);
  EXPECT_EQ(r.matched[0], (Vrp{pfx("10.1.0.0/16"), 24, 65001}));
  EXPECT_EQ(r.unmatched.size(), 2u);  // the /8 is too short, the AS65002 entry has another origin
}

TEST(Validation, As0NeverAuthorises) {
  auto t = table_of({Vrp{pfx("192.0.2.0/24"), 32, 0}});
  EXPECT_EQ(validity(*t, pfx("192.0.2.0/24"), 0), Validity::Invalid);
  EXPECT_EQ(validity(*t, pfx("192.0.2.0/24"), 65001), Validity::Invalid);
}

TEST(Validation, UncoveredByLessSpecificRoute) {
  // A VRP for a /16 says nothing about the covering /8 route.
  auto t = table_of({Vrp{pfx("10.1.0.0/16"), 24, 65001}});
  EXPECT_EQ(validity(*t, pfx("10.0.0.0/8"), 65001), Validity::NotFound);
}

TEST(Validation, AddingMatchingVrpOnlyChangesThatRoute) {
  auto before = table_of({Vrp{pfx("10.0.0.0/8"), 16, 65001}});
  VrpTable::Editor ed(before);
  ASSERT_EQ(ed.announce(Vrp{pfx("192.0.2.0/24"), 24, 65010}), EditErr::Ok);
  auto after = std::move(ed).commit(1, 2);

  EXPECT_EQ(validity(*before, pfx("192.0.2.0/24"), 65010), Validity::NotFound);
  EXPECT_EQ(validity(*after, pfx("192.0.2.0/24"), 65010), Validity::Valid);

  const std::vector<std::pair<const char*, std::uint32_t>> unrelated = {
      {"10.1.0.0/16", 65001}, {"10.1.0.0/24", 65001}, {"10.1.0.0/16", 65002}, {"198.51.100.0/24", 65010}};
  for (const auto& [r, asn] : unrelated) {
    EXPECT_EQ(validity(*before, pfx(r), asn), validity(*after, pfx(r), asn)) << r;
  }
}

TEST(Validation, WithdrawingSoleCoverRestoresNotFound) {
  const Vrp only{pfx("203.0.113.0/24"), 24, 65020};
  auto t = table_of({only, Vrp{pfx("10.0.0.0/8"), 8, 1}});
  EXPECT_EQ(validity(*t, pfx("203.0.113.0/24"), 65020), Validity::Valid);
  EXPECT_EQ(validity(*t, pfx("203.0.113.0/24"), 65021), Validity::Invalid);

  VrpTable::Editor ed(t);
  ASSERT_EQ(ed.withdraw(only), EditErr::Ok);
  auto next = std::move(ed).commit(1, 2);
  EXPECT_EQ(validity(*next, pfx("203.0.113.0/24"), 65020), Validity::NotFound);
  EXPECT_EQ(validity(*next, pfx("203.0.113.0/24"), 65021), Validity::NotFound);
}

TEST(Validation, Names) {
  EXPECT_STREQ(rpkiv::vrp::to_string(Validity::Valid), "valid");
  EXPECT_STREQ(rpkiv::vrp::to_string(Validity::NotFound), "not-found");
  EXPECT_STREQ(rpkiv::vrp::to_string(Validity::Invalid), "invalid");
}

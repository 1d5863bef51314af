/**
 * @file test_pool.cpp
 * @brief Authority policy, coordinator, event sink and the session pool end to end.
 */
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "fake_cache.hpp"
#include "rpkiv/pool/authority_policy.hpp"
#include "rpkiv/pool/coordinator.hpp"
#include "rpkiv/pool/event_sink.hpp"
#include "rpkiv/pool/session_pool.hpp"
#include "rpkiv/vrp/vrp_table.hpp"

using namespace rpkiv::pool;
using namespace std::chrono_literals;
using rpkiv::net::IpPrefix;
using rpkiv::rtr::SessionState;
using rpkiv::rtr::SessionStatus;
using rpkiv::rtr::SessionUpdate;
using rpkiv::vrp::Validity;
using rpkiv::vrp::Vrp;
using rpkiv::vrp::VrpStore;
using rpkiv::vrp::VrpTable;
using Clock = std::chrono::steady_clock;
namespace obs = rpkiv::obs;

namespace {

const Clock::time_point T0{std::chrono::hours(10)};

Candidate cand(std::size_t index, int pref, Health h,
               std::optional<Clock::time_point> up_since = std::nullopt,
               std::optional<Clock::time_point> last_sync = std::nullopt) {
  return Candidate{index, pref, h, up_since, last_sync};
}

std::shared_ptr<const VrpTable> table(std::uint32_t serial, std::uint32_t asn = 65001) {
  VrpTable::Editor ed;
  EXPECT_EQ(ed.announce(Vrp{*IpPrefix::parse("10.0.0.0/8"), 24, asn}), rpkiv::vrp::EditErr::Ok);
  return std::move(ed).commit(1, serial);
}

SessionStatus up(std::shared_ptr<const VrpTable> t, Clock::time_point synced, Clock::time_point since) {
  SessionStatus s;
  s.state = SessionState::Established;
  s.healthy = true;
  s.table = std::move(t);
  s.last_sync = synced;
  s.up_since = since;
  s.expire = 3600s;
  return s;
}

SessionStatus degraded(std::shared_ptr<const VrpTable> t, Clock::time_point synced) {
  SessionStatus s;
  s.state = SessionState::Error;
  s.table = std::move(t);
  s.last_sync = synced;
  s.expire = 3600s;
  return s;
}

SessionStatus down() {
  SessionStatus s;
  s.state = SessionState::Connecting;
  return s;
}

PoolConfig pool_config() {
  PoolConfig c;
  c.staleness_ceiling = 7200s;
  c.min_hold = 3000ms;
  c.recovery_hold = 30000ms;
  return c;
}

/// Coordinator over two sessions ("primary" preferred) with its own store and sink.
struct Fixture {
  VrpStore store;
  EventSink sink;
  rpkiv::test::CountingObserver counters;
  Coordinator coord;
  std::vector<std::uint64_t> notified;

  explicit Fixture(PoolConfig cfg = pool_config())
      : coord(cfg, {{"primary", 10}, {"secondary", 20}}, store, sink, &counters) {
    sink.subscribe([this](std::uint64_t v) { notified.push_back(v); });
  }

  void apply(std::size_t index, SessionStatus s, bool committed = false) {
    coord.apply(SessionUpdate{index, std::move(s), committed});
  }
};

} // namespace

// ---------- AuthorityPolicy ----------

TEST(AuthorityPolicy, InitialPicksMostPreferredUp) {
  AuthorityPolicy p(AuthorityConfig{3000ms, 30000ms});
  const auto d = p.evaluate(std::nullopt, {cand(0, 20, Health::Up), cand(1, 10, Health::Up)}, {}, T0);
  ASSERT_TRUE(d);
  EXPECT_EQ(d->index, 1u);
  EXPECT_EQ(d->reason, "initial");
}

TEST(AuthorityPolicy, UnhealthyCurrentFailsOverImmediately) {
  AuthorityPolicy p(AuthorityConfig{3000ms, 30000ms});
  // Hold timers do not delay a failover away from a session that is not Up.
  const auto d = p.evaluate(0, {cand(0, 10, Health::Degraded), cand(1, 20, Health::Up)}, T0 - 1ms, T0);
  ASSERT_TRUE(d);
  EXPECT_EQ(d->index, 1u);
  EXPECT_EQ(d->reason, "current_unhealthy");
}

TEST(AuthorityPolicy, StaleFallbackWhenNothingUp) {
  AuthorityPolicy p(AuthorityConfig{3000ms, 30000ms});
  const auto d = p.evaluate(0, {cand(0, 10, Health::Down), cand(1, 20, Health::Degraded)}, {}, T0);
  ASSERT_TRUE(d);
  EXPECT_EQ(d->index, 1u);
  EXPECT_EQ(d->reason, "stale_fallback");

  // A Degraded authority is kept while nothing is Up.
  EXPECT_FALSE(p.evaluate(1, {cand(0, 10, Health::Degraded), cand(1, 20, Health::Degraded)}, {}, T0));
  // Nothing usable at all.
  EXPECT_FALSE(p.evaluate(0, {cand(0, 10, Health::Down), cand(1, 20, Health::Down)}, {}, T0));
  EXPECT_FALSE(p.evaluate(std::nullopt, {}, {}, T0));
}

TEST(AuthorityPolicy, ReturnToPreferredRespectsHolds) {
  AuthorityPolicy p(AuthorityConfig{3000ms, 30000ms});
  const auto current = std::optional<std::size_t>{1};

  // Preferred has not been Up long enough.
  EXPECT_FALSE(p.evaluate(current, {cand(0, 10, Health::Up, T0 - 10s), cand(1, 20, Health::Up, T0 - 1h)},
                          T0 - 1h, T0));
  // Recovered, but the last switch was too recent.
  EXPECT_FALSE(p.evaluate(current, {cand(0, 10, Health::Up, T0 - 31s), cand(1, 20, Health::Up, T0 - 1h)},
                          T0 - 1s, T0));
  const auto d = p.evaluate(current, {cand(0, 10, Health::Up, T0 - 31s), cand(1, 20, Health::Up, T0 - 1h)},
                            T0 - 5s, T0);
  ASSERT_TRUE(d);
  EXPECT_EQ(d->index, 0u);
  EXPECT_EQ(d->reason, "return_to_preferred");
}

TEST(AuthorityPolicy, EquallyPreferredUpIsNotAReasonToSwitch) {
  AuthorityPolicy p(AuthorityConfig{0ms, 0ms});
  EXPECT_FALSE(p.evaluate(1, {cand(0, 10, Health::Up, T0 - 1h, T0), cand(1, 10, Health::Up, T0 - 1h, T0 - 1h)},
                          {}, T0));
}

TEST(AuthorityPolicy, TieBreakFreshestThenLowestIndex) {
  AuthorityPolicy p(AuthorityConfig{3000ms, 30000ms});
  auto d = p.evaluate(std::nullopt, {cand(0, 10, Health::Up, T0, T0 - 60s), cand(1, 10, Health::Up, T0, T0 - 5s)},
                      {}, T0);
  ASSERT_TRUE(d);
  EXPECT_EQ(d->index, 1u);

  d = p.evaluate(std::nullopt, {cand(2, 10, Health::Up, T0, T0), cand(1, 10, Health::Up, T0, T0)}, {}, T0);
  ASSERT_TRUE(d);
  EXPECT_EQ(d->index, 1u);
}

TEST(AuthorityPolicy, HealthNames) {
  EXPECT_STREQ(to_string(Health::Up), "up");
  EXPECT_STREQ(to_string(Health::Degraded), "degraded");
  EXPECT_STREQ(to_string(Health::Down), "down");
}

// ---------- Coordinator ----------

TEST(Coordinator, ValidateBeforeAnyDataIsNoData) {
  Fixture f;
  f.coord.evaluate(T0);
  const auto r = f.coord.validate(*IpPrefix::parse("10.1.0.0/16"), 65001, T0);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), ValidateErr::NoData);
  EXPECT_FALSE(f.coord.authority());
  EXPECT_TRUE(f.notified.empty());
}

TEST(Coordinator, PublishesAuthorityTableOnce) {
  Fixture f;
  const auto t1 = table(1);
  f.apply(0, up(t1, T0, T0), true);
  f.coord.evaluate(T0);

  ASSERT_TRUE(f.coord.authority());
  EXPECT_EQ(*f.coord.authority(), 0u);
  EXPECT_EQ(f.store.current()->table, t1);
  EXPECT_EQ(f.notified, (std::vector<std::uint64_t>{1}));

  const auto r = f.coord.validate(*IpPrefix::parse("10.1.0.0/16"), 65001, T0 + 1s);
  ASSERT_TRUE(r);
  EXPECT_EQ(r->state, Validity::Valid);

  // Same table again: nothing new to publish.
  f.coord.evaluate(T0 + 100ms);
  EXPECT_EQ(f.store.version(), 1u);

  // A newer commit from the authority is republished.
  f.apply(0, up(table(2), T0 + 1s, T0), true);
  f.coord.evaluate(T0 + 1s);
  EXPECT_EQ(f.store.version(), 2u);
  EXPECT_EQ(f.store.current()->table->serial(), 2u);
  EXPECT_EQ(f.counters.snapshot()[obs::Counter::Publishes], 2u);
}

TEST(Coordinator, CommitsFromNonAuthorityAreNotPublished) {
  Fixture f;
  f.apply(0, up(table(1), T0, T0));
  f.coord.evaluate(T0);
  f.apply(1, up(table(9, 65009), T0 + 1s, T0), true);
  f.coord.evaluate(T0 + 1s);
  EXPECT_EQ(f.store.current()->table->serial(), 1u);
  EXPECT_EQ(f.store.current()->source, 0u);
}

TEST(Coordinator, FailsOverWhenAuthorityGoesDown) {
  Fixture f;
  f.apply(0, up(table(1), T0, T0));
  f.apply(1, up(table(7, 65002), T0, T0));
  f.coord.evaluate(T0);
  ASSERT_EQ(f.coord.authority().value_or(99), 0u);

  f.apply(0, down());
  f.coord.evaluate(T0 + 1s);
  EXPECT_EQ(f.coord.authority().value_or(99), 1u);
  EXPECT_EQ(f.store.current()->table->serial(), 7u);
  EXPECT_EQ(f.store.current()->source, 1u);
  EXPECT_EQ(f.counters.snapshot()[obs::Counter::Failovers], 1u);

  const auto r = f.coord.validate(*IpPrefix::parse("10.0.0.0/16"), 65002, T0 + 1s);
  ASSERT_TRUE(r);
  EXPECT_EQ(r->state, Validity::Valid);
}

TEST(Coordinator, ReturnsToPreferredAfterRecoveryHold) {
  Fixture f;
  f.apply(0, down());
  f.apply(1, up(table(7, 65002), T0, T0));
  f.coord.evaluate(T0);
  ASSERT_EQ(f.coord.authority().value_or(99), 1u);

  f.apply(0, up(table(3), T0 + 10s, T0 + 10s));
  f.coord.evaluate(T0 + 20s);
  EXPECT_EQ(f.coord.authority().value_or(99), 1u);

  f.coord.evaluate(T0 + 41s);
  EXPECT_EQ(f.coord.authority().value_or(99), 0u);
  EXPECT_EQ(f.store.current()->table->serial(), 3u);
}

TEST(Coordinator, DegradedAuthorityKeepsServingStaleData) {
  Fixture f;
  const auto t1 = table(1);
  f.apply(0, up(t1, T0, T0));
  f.coord.evaluate(T0);

  f.apply(0, degraded(t1, T0));
  f.coord.evaluate(T0 + 10min);
  EXPECT_EQ(f.coord.authority().value_or(99), 0u);
  EXPECT_EQ(f.store.current()->table, t1);
  EXPECT_TRUE(f.coord.validate(*IpPrefix::parse("10.0.0.0/16"), 65001, T0 + 10min));

  const auto st = f.coord.status(T0 + 10min);
  ASSERT_EQ(st.sessions.size(), 2u);
  EXPECT_EQ(st.sessions[0].health, Health::Degraded);
  EXPECT_EQ(st.sessions[1].health, Health::Down);
  EXPECT_TRUE(st.available);
}

TEST(Coordinator, StalenessCeilingWithdrawsData) {
  auto cfg = pool_config();
  cfg.staleness_ceiling = 60s;
  Fixture f(cfg);
  f.apply(0, degraded(table(1), T0));
  f.coord.evaluate(T0);
  ASSERT_TRUE(f.store.current()->table);

  const auto late = T0 + 61s;
  auto r = f.coord.validate(*IpPrefix::parse("10.0.0.0/16"), 65001, late);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), ValidateErr::StalenessExceeded);
  EXPECT_FALSE(f.coord.status(late).available);

  f.coord.evaluate(late);
  f.coord.evaluate(late + 1s);
  EXPECT_FALSE(f.store.current()->table);
  r = f.coord.validate(*IpPrefix::parse("10.0.0.0/16"), 65001, late);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), ValidateErr::NoData);
  EXPECT_EQ(f.counters.snapshot()[obs::Counter::Withdrawals], 1u);
  EXPECT_EQ(f.notified, (std::vector<std::uint64_t>{1, 2}));
}

TEST(Coordinator, StatusReportsAuthoritySerialAndStaleness) {
  Fixture f;
  f.apply(0, up(table(5), T0, T0));
  f.apply(7, up(table(6), T0, T0));  // unknown index: ignored
  f.coord.evaluate(T0);

  const auto st = f.coord.status(T0 + 90s);
  EXPECT_EQ(st.authoritative.value_or(99), 0u);
  EXPECT_EQ(st.serial.value_or(0), 5u);
  EXPECT_EQ(st.staleness.value_or(0s), 90s);
  EXPECT_TRUE(st.available);
  EXPECT_EQ(st.version, 1u);
  EXPECT_EQ(st.sessions[0].name, "primary");
  EXPECT_EQ(st.sessions[0].health, Health::Up);
  EXPECT_EQ(st.sessions[1].preference, 20);
}

TEST(Coordinator, ValidateErrNames) {
  EXPECT_STREQ(to_string(ValidateErr::NoData), "no_data");
  EXPECT_STREQ(to_string(ValidateErr::StalenessExceeded), "staleness_exceeded");
}

// ---------- EventSink ----------

TEST(EventSink, SubscribeAndUnsubscribe) {
  EventSink sink;
  std::vector<std::uint64_t> got;
  const auto a = sink.subscribe([&](std::uint64_t v) { got.push_back(v); });
  const auto b = sink.subscribe([&](std::uint64_t v) { got.push_back(v * 10); });
  EXPECT_EQ(a, 1u);
  EXPECT_EQ(b, 2u);
  EXPECT_EQ(sink.size(), 2u);

  sink.notify(3);
  EXPECT_EQ(got, (std::vector<std::uint64_t>{3, 30}));

  EXPECT_TRUE(sink.unsubscribe(a));
  EXPECT_FALSE(sink.unsubscribe(a));
  EXPECT_FALSE(sink.unsubscribe(42));
  sink.notify(4);
  EXPECT_EQ(got, (std::vector<std::uint64_t>{3, 30, 40}));
}

TEST(EventSink, UnsubscribeDuringNotifySkipsRemoved) {
  EventSink sink;
  int second_calls = 0;
  SubscriptionId second = 0;
  sink.subscribe([&](std::uint64_t) { sink.unsubscribe(second); });
  second = sink.subscribe([&](std::uint64_t) { ++second_calls; });
  sink.notify(1);
  EXPECT_EQ(second_calls, 0);
  EXPECT_EQ(sink.size(), 1u);
}

TEST(EventSink, ThrowingSubscriberDoesNotStopOthers) {
  EventSink sink;
  int calls = 0;
  sink.subscribe([](std::uint64_t) { throw std::runtime_error("boom"); });
  sink.subscribe([](std::uint64_t) { throw 42; });
  sink.subscribe([&](std::uint64_t) { ++calls; });
  EXPECT_NO_THROW(sink.notify(1));
  EXPECT_EQ(calls, 1);
  EXPECT_NO_THROW(sink.notify(2));
  EXPECT_EQ(calls, 2);
}

// ---------- SessionPool ----------

TEST(SessionPool, CreateRejectsBadSetup) {
  auto none = SessionPool::create({}, pool_config());
  ASSERT_FALSE(none);
  EXPECT_EQ(none.error(), PoolError::NoCaches);

  auto cfg = pool_config();
  cfg.queue_capacity = 100;
  auto bad = SessionPool::create({rpkiv::test::fast_config()}, cfg);
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error(), PoolError::QueueCapacity);

  cfg.queue_capacity = 0;
  bad = SessionPool::create({rpkiv::test::fast_config()}, cfg);
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error(), PoolError::QueueCapacity);
}

/**
 * @test SessionPool.EndToEnd_FailoverKeepsValidating
 * @brief Two in-memory caches. The preferred one becomes authoritative; once it
 *        refuses connections and drops its session, the pool fails over and keeps
 *        answering validation queries from the secondary's table.
 */
TEST(SessionPool, EndToEnd_FailoverKeepsValidating) {
  auto primary = rpkiv::test::cache_with_table();
  auto secondary = rpkiv::test::cache_with_table();
  secondary->session_id = 88;
  secondary->serial = 40;
  secondary->table.push_back(rpkiv::rtr::PrefixPdu{1, true, *IpPrefix::parse("192.0.2.0/24"), 24, 65100});

  auto cfg = pool_config();
  cfg.tick = 10ms;
  cfg.min_hold = 0ms;
  cfg.recovery_hold = 0ms;
  rpkiv::test::CountingObserver counters;
  auto created = SessionPool::create(
      {rpkiv::test::fast_config("primary", 10), rpkiv::test::fast_config("secondary", 20)}, cfg,
      [&](const rpkiv::rtr::CacheConfig& c) -> std::unique_ptr<rpkiv::rtr::Connector> {
        return std::make_unique<rpkiv::test::FakeConnector>(c.name == "primary" ? primary : secondary);
      },
      &counters);
  ASSERT_TRUE(created);
  auto& pool = **created;
  EXPECT_EQ(pool.size(), 2u);

  std::atomic<std::uint64_t> last_version{0};
  const auto id = pool.subscribe([&](std::uint64_t v) { last_version = v; });
  EXPECT_FALSE(pool.validate(*IpPrefix::parse("10.0.0.0/16"), 65001));

  pool.start();
  ASSERT_TRUE(rpkiv::test::eventually([&] {
    const auto st = pool.status();
    return st.authoritative && *st.authoritative == 0 && st.available;
  }));
  auto r = pool.validate(*IpPrefix::parse("10.0.0.0/16"), 65001);
  ASSERT_TRUE(r);
  EXPECT_EQ(r->state, Validity::Valid);
  EXPECT_EQ(pool.validate(*IpPrefix::parse("192.0.2.0/24"), 65100)->state, Validity::NotFound);
  EXPECT_GT(last_version.load(), 0u);

  {
    std::lock_guard<std::mutex> lk(primary->mu);
    primary->refuse_connects = 1000000;
    primary->table.clear();
  }
  primary->drop_connection();

  // The primary is now Degraded; the secondary is Up.
  ASSERT_TRUE(rpkiv::test::eventually([&] {
    const auto st = pool.status();
    return st.authoritative && *st.authoritative == 1;
  }));
  ASSERT_TRUE(rpkiv::test::eventually([&] { return pool.snapshot()->source == 1u; }));
  r = pool.validate(*IpPrefix::parse("192.0.2.0/24"), 65100);
  ASSERT_TRUE(r);
  EXPECT_EQ(r->state, Validity::Valid);
  EXPECT_EQ(pool.snapshot()->table->serial(), 40u);

  EXPECT_TRUE(pool.unsubscribe(id));
  pool.stop();
  // Published data stays readable after stop.
  EXPECT_TRUE(pool.validate(*IpPrefix::parse("10.0.0.0/16"), 65001));
  EXPECT_GE(counters.snapshot()[obs::Counter::Failovers], 1u);
}

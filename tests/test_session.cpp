/**
 * @file test_session.cpp
 * @brief RtrSession control loop against an in-memory scripted cache.
 */
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <vector>

#include "fake_cache.hpp"
#include "rpkiv/rtr/session.hpp"

using namespace rpkiv::rtr;
using namespace rpkiv::test;
namespace obs = rpkiv::obs;

namespace {

/// Collects published updates; can be told to refuse them.
struct Updates {
  std::mutex mu;
  std::vector<SessionUpdate> seen;
  std::atomic<bool> accept{true};

  RtrSession::Publisher publisher() {
    return [this](const SessionUpdate& u) {
      if (!accept.load()) return false;
      std::lock_guard<std::mutex> lk(mu);
      seen.push_back(u);
      return true;
    };
  }

  int commits() {
    std::lock_guard<std::mutex> lk(mu);
    return static_cast<int>(std::count_if(seen.begin(), seen.end(), [](const SessionUpdate& u) { return u.committed; }));
  }

  SessionUpdate last() {
    std::lock_guard<std::mutex> lk(mu);
    return seen.empty() ? SessionUpdate{} : seen.back();
  }
};

} // namespace

TEST(RtrSession, FullSyncPublishesCommittedUpdate) {
  auto cache = cache_with_table();
  Updates updates;
  CountingObserver counters;
  RtrSession s(3, fast_config(), std::make_unique<FakeConnector>(cache), updates.publisher(), &counters);
  EXPECT_EQ(s.index(), 3u);
  EXPECT_EQ(s.status().state, SessionState::Disconnected);

  s.start();
  EXPECT_TRUE(s.running());
  ASSERT_TRUE(eventually([&] { return updates.commits() >= 1; }));

  const auto st = s.status();
  EXPECT_EQ(st.state, SessionState::Established);
  ASSERT_TRUE(st.table);
  EXPECT_EQ(st.table->size(), 2u);
  EXPECT_EQ(st.session_id.value_or(0), 77);
  EXPECT_EQ(cache->count_received<ResetQuery>(), 1);

  s.stop();
  EXPECT_FALSE(s.running());
  EXPECT_EQ(updates.last().status.state, SessionState::Disconnected);
  EXPECT_EQ(updates.last().index, 3u);

  const auto snap = counters.snapshot();
  EXPECT_EQ(snap[obs::Counter::FullSyncs], 1u);
  EXPECT_GE(snap[obs::Counter::PdusReceived], 4u);
  EXPECT_GE(snap[obs::Counter::PdusSent], 1u);
  EXPECT_GT(counters.events(), 0u);
}

TEST(RtrSession, StopInterruptsBlockingRead) {
  auto cache = cache_with_table();
  cache->silent = true;
  auto cfg = fast_config();
  cfg.timers.cache_response = 60s;
  Updates updates;
  CountingObserver counters;
  RtrSession s(0, cfg, std::make_unique<FakeConnector>(cache), updates.publisher(), &counters);
  s.start();
  ASSERT_TRUE(eventually([&] { return cache->count_received<ResetQuery>() == 1; }));

  const auto t0 = std::chrono::steady_clock::now();
  s.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
  EXPECT_EQ(updates.commits(), 0);
  EXPECT_EQ(s.status().state, SessionState::Disconnected);
  EXPECT_FALSE(s.status().table);
}

TEST(RtrSession, ConnectFailuresBackOffThenSync) {
  auto cache = cache_with_table();
  cache->refuse_connects = 2;
  Updates updates;
  CountingObserver counters;
  RtrSession s(0, fast_config(), std::make_unique<FakeConnector>(cache), updates.publisher(), &counters);
  s.start();
  ASSERT_TRUE(eventually([&] { return updates.commits() >= 1; }));
  s.stop();

  {
    std::lock_guard<std::mutex> lk(cache->mu);
    EXPECT_EQ(cache->connects, 3);
  }
  EXPECT_EQ(counters.snapshot()[obs::Counter::TransportErrors], 2u);
  EXPECT_EQ(s.status().failures, 2u);
}

TEST(RtrSession, MalformedPduAnsweredWithErrorReportThenResync) {
  auto cache = cache_with_table();
  // IPv4 Prefix with max-length below prefix length.
  cache->corrupt_once = {1, 4, 0, 0, 0, 0, 0, 20, 1, 24, 16, 0, 10, 0, 0, 0, 0, 0, 0xFD, 0xE9};
  const auto corrupt = cache->corrupt_once;
  Updates updates;
  CountingObserver counters;
  RtrSession s(0, fast_config(), std::make_unique<FakeConnector>(cache), updates.publisher(), &counters);
  s.start();
  ASSERT_TRUE(eventually([&] { return updates.commits() >= 1; }));
  s.stop();

  std::lock_guard<std::mutex> lk(cache->mu);
  const auto it = std::find_if(cache->received.begin(), cache->received.end(),
                               [](const Pdu& p) { return std::holds_alternative<ErrorReport>(p); });
  ASSERT_NE(it, cache->received.end());
  const auto& rep = std::get<ErrorReport>(*it);
  EXPECT_EQ(rep.code, static_cast<std::uint16_t>(ErrorCode::CorruptData));
  EXPECT_EQ(rep.erroneous_pdu, corrupt);
  EXPECT_EQ(cache->connects, 2);
  EXPECT_EQ(counters.snapshot()[obs::Counter::ProtocolErrors], 1u);
}

TEST(RtrSession, PeerCloseResumesWithSerialQuery) {
  auto cache = cache_with_table();
  Updates updates;
  CountingObserver counters;
  RtrSession s(0, fast_config(), std::make_unique<FakeConnector>(cache), updates.publisher(), &counters);
  s.start();
  ASSERT_TRUE(eventually([&] { return updates.commits() >= 1; }));

  cache->drop_connection();
  ASSERT_TRUE(eventually([&] { return updates.commits() >= 2; }));
  const auto st = s.status();
  s.stop();

  EXPECT_EQ(cache->count_received<SerialQuery>(), 1);
  EXPECT_EQ(cache->count_received<ResetQuery>(), 1);
  ASSERT_TRUE(st.table);
  EXPECT_EQ(st.table->serial(), 2u);
  EXPECT_EQ(st.table->size(), 2u);
  EXPECT_EQ(counters.snapshot()[obs::Counter::Deltas], 1u);
}

TEST(RtrSession, RefusedUpdatesAreCoalesced) {
  auto cache = cache_with_table();
  Updates updates;
  updates.accept = false;
  RtrSession s(0, fast_config(), std::make_unique<FakeConnector>(cache), updates.publisher());
  s.start();
  ASSERT_TRUE(eventually([&] { return s.status().table != nullptr; }));
  EXPECT_EQ(updates.commits(), 0);

  updates.accept = true;
  ASSERT_TRUE(eventually([&] { return updates.commits() >= 1; }));
  s.stop();
  EXPECT_EQ(updates.commits(), 1);
}

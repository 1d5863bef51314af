#pragma once
/**
 * @file fake_cache.hpp
 * @brief In-memory RTR cache behind the Connector/Transport seam, plus test helpers.
 */

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "rpkiv/net/ip_prefix.hpp"
#include "rpkiv/obs/observability.hpp"
#include "rpkiv/rtr/pdu.hpp"
#include "rpkiv/rtr/session_config.hpp"
#include "rpkiv/rtr/transport.hpp"

namespace rpkiv::test {

using namespace rpkiv::rtr;
using namespace std::chrono_literals;

/// Cache side of the in-memory wire. Answers queries synchronously from write_all.
struct FakeCache {
  std::mutex mu;
  std::condition_variable cv;

  // Script
  std::uint16_t session_id{77};
  std::uint32_t serial{1};
  std::vector<PrefixPdu> table;
  int  refuse_connects{0};
  bool silent{false};
  std::vector<std::uint8_t> corrupt_once;  ///< Sent after the first Cache Response instead of the table

  // Observed
  int connects{0};
  std::vector<Pdu> received;

  // Current connection
  std::deque<std::uint8_t> inbound;
  bool peer_closed{false};
  bool cancelled{false};

  void push(const Pdu& p) {
    const auto b = encode(p);
    inbound.insert(inbound.end(), b.begin(), b.end());
  }

  void answer(const Pdu& q) {
    received.push_back(q);
    if (silent) return;
    if (std::holds_alternative<ResetQuery>(q)) {
      push(CacheResponse{1, session_id});
      if (!corrupt_once.empty()) {
        inbound.insert(inbound.end(), corrupt_once.begin(), corrupt_once.end());
        corrupt_once.clear();
        return;
      }
      for (const auto& p : table) push(p);
      push(EndOfData{1, session_id, serial, 900, 300, 3600});
    } else if (std::holds_alternative<SerialQuery>(q)) {
      push(CacheResponse{1, session_id});
      push(EndOfData{1, session_id, ++serial, 900, 300, 3600});
    }
    cv.notify_all();
  }

  template <class T>
  int count_received() {
    std::lock_guard<std::mutex> lk(mu);
    return static_cast<int>(std::count_if(received.begin(), received.end(),
                                          [](const Pdu& p) { return std::holds_alternative<T>(p); }));
  }

  void drop_connection() {
    std::lock_guard<std::mutex> lk(mu);
    peer_closed = true;
    cv.notify_all();
  }
};

class FakeTransport final : public Transport {
public:
  explicit FakeTransport(std::shared_ptr<FakeCache> cache) : cache_(std::move(cache)) {}

  rpkiv_detail::expected<std::size_t, TransportError>
  read_some(std::span<std::uint8_t> buf, std::chrono::milliseconds timeout) override {
    std::unique_lock<std::mutex> lk(cache_->mu);
    cache_->cv.wait_for(lk, timeout, [&] {
      return !cache_->inbound.empty() || cache_->peer_closed || cache_->cancelled;
    });
    if (cache_->cancelled) return rpkiv_detail::unexpected(TransportError{TransportError::Kind::Cancelled, "cancelled"});
    if (cache_->inbound.empty()) {
      if (cache_->peer_closed) return rpkiv_detail::unexpected(TransportError{TransportError::Kind::Closed, "eof"});
      return rpkiv_detail::unexpected(TransportError{TransportError::Kind::Timeout, "timeout"});
    }
    const auto n = std::min(buf.size(), cache_->inbound.size());
    std::copy_n(cache_->inbound.begin(), n, buf.begin());
    cache_->inbound.erase(cache_->inbound.begin(), cache_->inbound.begin() + static_cast<std::ptrdiff_t>(n));
    return n;
  }

  rpkiv_detail::expected<void, TransportError>
  write_all(std::span<const std::uint8_t> bytes, std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lk(cache_->mu);
    auto pdu = decode(bytes);
    if (!pdu) return rpkiv_detail::unexpected(TransportError{TransportError::Kind::Io, "undecodable write"});
    cache_->answer(*pdu);
    return {};
  }

  void close() noexcept override {}

  void cancel() noexcept override {
    std::lock_guard<std::mutex> lk(cache_->mu);
    cache_->cancelled = true;
    cache_->cv.notify_all();
  }

private:
  std::shared_ptr<FakeCache> cache_;
};

class FakeConnector final : public Connector {
public:
  explicit FakeConnector(std::shared_ptr<FakeCache> cache) : cache_(std::move(cache)) {}

  rpkiv_detail::expected<std::unique_ptr<Transport>, TransportError>
  connect(std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lk(cache_->mu);
    ++cache_->connects;
    if (cache_->refuse_connects > 0) {
      --cache_->refuse_connects;
      return rpkiv_detail::unexpected(TransportError{TransportError::Kind::Refused, "refused"});
    }
    cache_->inbound.clear();
    cache_->peer_closed = false;
    cache_->cancelled = false;
    return std::unique_ptr<Transport>(std::make_unique<FakeTransport>(cache_));
  }

  void cancel() noexcept override {}
  std::string describe() const override { return "fake://cache"; }

private:
  std::shared_ptr<FakeCache> cache_;
};

class CountingObserver final : public rpkiv::obs::Observer {
public:
  void record(const rpkiv::obs::SessionEvent&) override { events_.fetch_add(1, std::memory_order_relaxed); }
  void count(rpkiv::obs::Counter c, std::uint64_t n = 1) override {
    values_[static_cast<std::size_t>(c)].fetch_add(n, std::memory_order_relaxed);
  }
  rpkiv::obs::Counters snapshot() const override {
    rpkiv::obs::Counters out;
    for (std::size_t i = 0; i < out.values.size(); ++i) out.values[i] = values_[i].load(std::memory_order_relaxed);
    return out;
  }
  std::uint64_t events() const { return events_.load(); }

private:
  std::array<std::atomic<std::uint64_t>, static_cast<std::size_t>(rpkiv::obs::Counter::Count_)> values_{};
  std::atomic<std::uint64_t> events_{0};
};

template <class Pred>
inline bool eventually(Pred pred, std::chrono::milliseconds timeout = 5000ms) {
  const auto until = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < until) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

/// Cache config with short timers and backoff.
inline CacheConfig fast_config(std::string name = "fake", int preference = 100) {
  CacheConfig c;
  c.name = std::move(name);
  c.host = c.name;
  c.preference = preference;
  c.protocol_version = 1;
  c.timers.connect = 200ms;
  c.timers.response = 200ms;
  c.backoff.base = 10ms;
  c.backoff.max = 50ms;
  return c;
}

inline std::shared_ptr<FakeCache> cache_with_table() {
  auto c = std::make_shared<FakeCache>();
  c->table = {PrefixPdu{1, true, *net::IpPrefix::parse("10.0.0.0/8"), 24, 65001},
              PrefixPdu{1, true, *net::IpPrefix::parse("2001:db8::/32"), 48, 65002}};
  return c;
}

} // namespace rpkiv::test

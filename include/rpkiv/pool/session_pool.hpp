#pragma once
/**
 * @file session_pool.hpp
 * @brief Owns one RtrSession per cache, the coordinator thread and the published VRP store.
 *
 * Data flow:
 *   RtrSession thread ──SpscQueue<SessionUpdate>──► coordinator thread ──► VrpStore ──► validate()
 *                                                                 └──► EventSink subscribers
 *
 * Each session is the only producer of its ring and the coordinator thread is the
 * only consumer of all rings, so the store has exactly one writer.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "rpkiv/compat/expected.hpp"
#include "rpkiv/mem/spsc_queue.hpp"
#include "rpkiv/net/ip_prefix.hpp"
#include "rpkiv/obs/observability.hpp"
#include "rpkiv/pool/coordinator.hpp"
#include "rpkiv/pool/event_sink.hpp"
#include "rpkiv/rtr/session.hpp"
#include "rpkiv/rtr/session_config.hpp"
#include "rpkiv/rtr/transport.hpp"
#include "rpkiv/vrp/validation.hpp"
#include "rpkiv/vrp/vrp_store.hpp"

namespace rpkiv::pool {

/// Build the connector for one cache. The default opens plain TCP.
using ConnectorFactory = std::function<std::unique_ptr<rtr::Connector>(const rtr::CacheConfig&)>;

/// Setup failures reported by SessionPool::create().
enum class PoolError : std::uint8_t {
    NoCaches = 1,      ///< At least one cache is required
    QueueCapacity,     ///< queue_capacity is zero or not a power of two
    QueueAllocation    ///< Ring allocation failed
};

const char* to_string(PoolError e) noexcept;

class SessionPool {
public:
    /**
     * @brief Factory: validates the configuration and allocates every ring up front.
     * @param caches One entry per cache; index order is the session index.
     * @param factory Connector per cache (plain TCP when empty).
     */
    static rpkiv_detail::expected<std::unique_ptr<SessionPool>, PoolError>
    create(std::vector<rtr::CacheConfig> caches, PoolConfig cfg,
           ConnectorFactory factory = {}, obs::Observer* observer = nullptr);

    ~SessionPool();

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    /// Start the coordinator and every session.
    void start();

    /// Stop every session, then the coordinator. Published data stays readable.
    void stop();

    /// Register a callback for every store version change (runs on the coordinator thread).
    SubscriptionId subscribe(EventSink::Callback cb) { return sink_.subscribe(std::move(cb)); }
    bool unsubscribe(SubscriptionId id) { return sink_.unsubscribe(id); }

    /// Validate a route against the published snapshot. Safe from any thread.
    rpkiv_detail::expected<vrp::ValidationResult, ValidateErr>
    validate(const net::IpPrefix& route, std::uint32_t origin_as) const;

    [[nodiscard]] PoolStatus status() const;

    /// Current published snapshot (never null).
    [[nodiscard]] std::shared_ptr<const vrp::Snapshot> snapshot() const noexcept { return store_.current(); }

    [[nodiscard]] std::size_t size() const noexcept { return sessions_.size(); }

private:
    using UpdateQueue = mem::SpscQueue<rtr::SessionUpdate>;

    SessionPool(std::vector<rtr::CacheConfig> caches, PoolConfig cfg, ConnectorFactory factory,
                obs::Observer* observer, std::vector<std::unique_ptr<UpdateQueue>> queues);

    void run();
    void drain();

    PoolConfig     cfg_;
    obs::Observer* obs_;
    vrp::VrpStore  store_;
    EventSink      sink_;
    Coordinator    coord_;

    std::vector<std::unique_ptr<UpdateQueue>> queues_;
    std::vector<std::unique_ptr<rtr::RtrSession>> sessions_;

    std::mutex              mu_;
    std::condition_variable cv_;
    std::atomic<bool>       stop_{false};
    std::atomic<bool>       running_{false};
    std::thread             th_;
};

} // namespace rpkiv::pool

/**
 * @file session_pool.cpp
 * @brief SessionPool wiring and coordinator thread.
 */
#include "rpkiv/pool/session_pool.hpp"

#include <utility>

#include "rpkiv/rtr/tcp_transport.hpp"

namespace rpkiv::pool {

const char* to_string(PoolError e) noexcept {
    switch (e) {
        case PoolError::NoCaches:        return "no caches configured";
        case PoolError::QueueCapacity:   return "update queue capacity must be a power of two";
        case PoolError::QueueAllocation: return "update queue allocation failed";
    }
    return "unknown";
}

static std::vector<Coordinator::Member> members_of(const std::vector<rtr::CacheConfig>& caches) {
    std::vector<Coordinator::Member> m;
    m.reserve(caches.size());
    for (const auto& c : caches) m.push_back(Coordinator::Member{c.name, c.preference});
    return m;
}

rpkiv_detail::expected<std::unique_ptr<SessionPool>, PoolError>
SessionPool::create(std::vector<rtr::CacheConfig> caches, PoolConfig cfg,
                    ConnectorFactory factory, obs::Observer* observer) {
    if (caches.empty()) return rpkiv_detail::unexpected(PoolError::NoCaches);
    std::vector<std::unique_ptr<UpdateQueue>> queues;
    queues.reserve(caches.size());
    for (std::size_t i = 0; i < caches.size(); ++i) {
        auto q = UpdateQueue::with_capacity(cfg.queue_capacity);
        if (!q) {
            return rpkiv_detail::unexpected(q.error() == mem::SpscError::AllocationFailed
                                                ? PoolError::QueueAllocation
                                                : PoolError::QueueCapacity);
        }
        queues.push_back(std::make_unique<UpdateQueue>(std::move(*q)));
    }
    return std::unique_ptr<SessionPool>(
        new SessionPool(std::move(caches), cfg, std::move(factory), observer, std::move(queues)));
}

SessionPool::SessionPool(std::vector<rtr::CacheConfig> caches, PoolConfig cfg, ConnectorFactory factory,
                         obs::Observer* observer, std::vector<std::unique_ptr<UpdateQueue>> queues)
    : cfg_(cfg),
      obs_(observer ? observer : obs::make_log_observer()),
      coord_(cfg, members_of(caches), store_, sink_, obs_),
      queues_(std::move(queues)) {
    if (!factory) {
        factory = [](const rtr::CacheConfig& c) -> std::unique_ptr<rtr::Connector> {
            return std::make_unique<rtr::TcpConnector>(c.host, c.port, c.credentials);
        };
    }
    sessions_.reserve(caches.size());
    for (std::size_t i = 0; i < caches.size(); ++i) {
        UpdateQueue* q = queues_[i].get();
        auto publish = [this, q](const rtr::SessionUpdate& u) {
            if (!q->push(u)) return false;
            cv_.notify_one();
            return true;
        };
        auto connector = factory(caches[i]);
        sessions_.push_back(std::make_unique<rtr::RtrSession>(i, std::move(caches[i]), std::move(connector),
                                                              std::move(publish), obs_));
    }
}

SessionPool::~SessionPool() { stop(); }

void SessionPool::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) return;
    stop_.store(false, std::memory_order_release);
    th_ = std::thread([this] { run(); });
    for (auto& s : sessions_) s->start();
    obs::logger()->info("session pool started with {} cache(s)", sessions_.size());
}

void SessionPool::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;
    for (auto& s : sessions_) s->stop();
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
    if (th_.joinable()) th_.join();
    drain(); // final session states, consumed after the coordinator thread exited
    obs::logger()->info("session pool stopped");
}

rpkiv_detail::expected<vrp::ValidationResult, ValidateErr>
SessionPool::validate(const net::IpPrefix& route, std::uint32_t origin_as) const {
    return coord_.validate(route, origin_as, std::chrono::steady_clock::now());
}

PoolStatus SessionPool::status() const {
    return coord_.status(std::chrono::steady_clock::now());
}

void SessionPool::drain() {
    for (auto& q : queues_) {
        q->drain([this](rtr::SessionUpdate&& u) { coord_.apply(u); });
    }
}

void SessionPool::run() {
    while (!stop_.load(std::memory_order_acquire)) {
        drain();
        coord_.evaluate(std::chrono::steady_clock::now());
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait_for(lk, cfg_.tick, [this] { return stop_.load(std::memory_order_acquire); });
    }
}

} // namespace rpkiv::pool

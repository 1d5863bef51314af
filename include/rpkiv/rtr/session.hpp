#pragma once
/**
 * @file session.hpp
 * @brief One RTR cache session on its own thread.
 *
 * RtrSession owns a SessionMachine, a Connector and the current Transport. Its
 * thread reads from the transport, frames PDUs, feeds the machine and executes
 * the returned steps. Every externally visible change (transition, commit,
 * health flag) is handed to the Publisher as a SessionUpdate.
 *
 * Threading:
 *   - The machine, framer and transport I/O belong to the session thread.
 *   - status() and stop() may be called from any thread.
 */

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "rpkiv/obs/observability.hpp"
#include "rpkiv/rtr/pdu.hpp"
#include "rpkiv/rtr/session_config.hpp"
#include "rpkiv/rtr/session_machine.hpp"
#include "rpkiv/rtr/transport.hpp"

namespace rpkiv::rtr {

/** @struct SessionUpdate
 *  @brief What a session reports to its consumer.
 */
struct SessionUpdate {
    std::size_t   index{0};        ///< Position of the session in its pool
    SessionStatus status{};
    bool          committed{false}; ///< status.table is a newly committed snapshot
};

class RtrSession {
public:
    /// Deliver an update; return false if it could not be accepted now (retried later, coalesced).
    using Publisher = std::function<bool(const SessionUpdate&)>;

    RtrSession(std::size_t index, CacheConfig cfg, std::unique_ptr<Connector> connector,
               Publisher publish, obs::Observer* observer = nullptr);
    ~RtrSession();

    RtrSession(const RtrSession&) = delete;
    RtrSession& operator=(const RtrSession&) = delete;

    /// Spawn the session thread. No-op if already running.
    void start();

    /// Interrupt blocking I/O and join. The working table is discarded; nothing is published for it.
    void stop();

    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] SessionStatus status() const;
    [[nodiscard]] const CacheConfig& config() const noexcept { return cfg_; }
    [[nodiscard]] std::size_t index() const noexcept { return index_; }

private:
    using clock = std::chrono::steady_clock;

    void run();
    void execute(SessionStep step);
    void do_connect();
    void pump();
    void idle();
    void flush_pending();
    std::chrono::milliseconds wait_budget(clock::time_point now) const;

    std::size_t   index_;
    CacheConfig   cfg_;
    std::unique_ptr<Connector> connector_;
    Publisher     publish_;
    obs::Observer* obs_;

    SessionMachine machine_;
    PduFramer      framer_;
    std::array<std::uint8_t, 16384> rxbuf_{};
    bool           connect_pending_{false};
    std::optional<SessionUpdate> pending_;  ///< Update the publisher refused

    mutable std::mutex mu_;                 ///< Guards transport_ (for cancel) and status_
    std::condition_variable cv_;
    std::unique_ptr<Transport> transport_;
    SessionStatus  status_;

    std::atomic<bool> stop_{false};
    std::atomic<bool> running_{false};
    std::thread    th_;
};

} // namespace rpkiv::rtr

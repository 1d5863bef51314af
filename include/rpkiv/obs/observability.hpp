#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: session events + counters, backed by spdlog.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace rpkiv::obs {

    /** @struct LogConfig
     *  @brief Logger setup (level name as understood by spdlog, output pattern).
     */
    struct LogConfig {
        std::string level{"info"};
        std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
    };

    /// Configure the shared "rpkiv" logger. Safe to call more than once.
    void init_logging(const LogConfig& cfg);

    /// Shared "rpkiv" logger (created with defaults on first use).
    std::shared_ptr<spdlog::logger> logger();

    /** @enum Counter
     *  @brief Process-level counters.
     */
    enum class Counter : std::uint8_t {
        PdusReceived,
        PdusSent,
        FullSyncs,          ///< Committed full transfers
        Deltas,             ///< Committed incremental transfers
        CacheResets,        ///< Cache Reset PDUs honoured
        ProtocolErrors,     ///< Malformed / unexpected PDUs
        TransportErrors,    ///< Connect, read, write failures and timeouts
        CacheErrors,        ///< Error Reports received
        Failovers,          ///< Authoritative session changed
        Publishes,          ///< Snapshots installed in the store
        Withdrawals,        ///< Store marked unavailable
        Count_
    };

    const char* to_string(Counter c) noexcept;

    /** @struct Counters
     *  @brief Snapshot of all counters, indexed by Counter.
     */
    struct Counters {
        std::array<std::uint64_t, static_cast<std::size_t>(Counter::Count_)> values{};
        std::uint64_t operator[](Counter c) const noexcept { return values[static_cast<std::size_t>(c)]; }
    };

    /** @struct SessionEvent
     *  @brief One session state transition.
     */
    struct SessionEvent {
        std::string session;   ///< Cache name
        std::string from;      ///< Previous state
        std::string to;        ///< New state
        std::string reason;    ///< Reason label (for humans/logs)
        std::uint32_t serial{0};
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single state transition.
        virtual void record(const SessionEvent& e) = 0;
        /// Bump a counter.
        virtual void count(Counter c, std::uint64_t n = 1) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide observer that logs events through logger().
    Observer* make_log_observer();

} // namespace rpkiv::obs

#pragma once
/**
 * @file session_machine.hpp
 * @brief RTR client state machine, free of I/O and clocks.
 *
 * Every input carries the current monotonic time and returns a SessionStep that
 * tells the caller what to do: PDUs to send, whether to close or (re)connect,
 * and the snapshot to publish. The caller (RtrSession) owns the transport.
 *
 *   Disconnected → Connecting → AwaitingCacheResponse → ReceivingFullTable → Established
 *   Established ⇄ ReceivingDelta
 *   any → Error → (backoff) → Disconnected → Connecting
 *
 * Published tables are only ever produced by End of Data; a stop or an error
 * discards the working table.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "rpkiv/rtr/backoff.hpp"
#include "rpkiv/rtr/pdu.hpp"
#include "rpkiv/rtr/session_config.hpp"
#include "rpkiv/rtr/transport.hpp"
#include "rpkiv/vrp/vrp_table.hpp"

namespace rpkiv::rtr {

/** @enum SessionState
 *  @brief Lifecycle of one cache session.
 */
enum class SessionState : std::uint8_t {
    Disconnected,
    Connecting,
    AwaitingCacheResponse,
    ReceivingFullTable,
    Established,
    ReceivingDelta,
    Error
};

const char* to_string(SessionState s) noexcept;

/** @enum FailureKind
 *  @brief Why a step entered Error.
 */
enum class FailureKind : std::uint8_t { None, Transport, Protocol, CacheSignaled };

struct Transition {
    SessionState from;
    SessionState to;
    std::string  reason;
};

/** @struct SessionStep
 *  @brief Actions requested by one input, to be executed in field order.
 */
struct SessionStep {
    std::vector<Pdu> send;                          ///< Write these first
    bool close{false};                              ///< Then close the transport
    std::shared_ptr<const vrp::VrpTable> commit;    ///< Then publish this snapshot
    bool full_sync{false};                          ///< commit came from a full transfer
    bool cache_reset{false};                        ///< A Cache Reset was honoured
    bool connect{false};                            ///< Then open a new transport
    FailureKind failure{FailureKind::None};
    bool health_changed{false};                     ///< Stall flag flipped
    std::vector<Transition> transitions;

    bool reportable() const noexcept { return commit || health_changed || !transitions.empty(); }
};

/** @struct SessionStatus
 *  @brief Point-in-time view of a session for status surfaces.
 */
struct SessionStatus {
    SessionState state{SessionState::Disconnected};
    std::optional<std::uint16_t> session_id;
    std::optional<std::uint32_t> serial;
    std::uint8_t  version{0};
    bool          version_locked{false};
    bool          healthy{false};
    bool          stalled{false};
    std::shared_ptr<const vrp::VrpTable> table;               ///< Last committed snapshot
    std::optional<std::chrono::steady_clock::time_point> last_sync;
    std::optional<std::chrono::steady_clock::time_point> up_since;
    std::uint32_t failures{0};
    std::string   last_error;
    std::chrono::seconds refresh{0};                          ///< Intervals in force
    std::chrono::seconds retry{0};
    std::chrono::seconds expire{0};

    /// Committed table still usable at @p now (synced within the expire interval).
    bool usable(std::chrono::steady_clock::time_point now) const noexcept {
        return table && last_sync && now - *last_sync < expire;
    }
};

class SessionMachine {
public:
    using clock = std::chrono::steady_clock;

    explicit SessionMachine(const CacheConfig& cfg);

    SessionStep start(clock::time_point now);
    SessionStep on_connected(clock::time_point now);
    SessionStep on_connect_failed(clock::time_point now, const TransportError& err);
    SessionStep on_transport_error(clock::time_point now, const TransportError& err);

    /**
     * @brief Feed one decoded PDU.
     * @param raw Wire bytes of @p pdu, encapsulated in any Error Report we send
     *            (re-encoded from @p pdu when empty).
     */
    SessionStep on_pdu(clock::time_point now, const Pdu& pdu, std::span<const std::uint8_t> raw = {});

    /// Feed a PDU the codec rejected.
    SessionStep on_malformed(clock::time_point now, const MalformedPdu& err, std::span<const std::uint8_t> raw);

    /// Drive timers: backoff expiry, response/end-of-data timeouts, keepalive, stall detection.
    SessionStep on_tick(clock::time_point now);

    /// Cancel: close and return to Disconnected without publishing.
    SessionStep stop(clock::time_point now);

    /// Earliest time on_tick has work to do, if any.
    [[nodiscard]] std::optional<clock::time_point> next_deadline() const noexcept;

    [[nodiscard]] SessionState state() const noexcept { return state_; }
    [[nodiscard]] bool healthy() const noexcept;
    [[nodiscard]] std::uint8_t version() const noexcept { return version_; }
    [[nodiscard]] std::optional<std::uint32_t> serial() const noexcept { return serial_; }
    [[nodiscard]] std::optional<std::uint16_t> session_id() const noexcept { return session_id_; }
    [[nodiscard]] const std::shared_ptr<const vrp::VrpTable>& table() const noexcept { return committed_; }
    [[nodiscard]] SessionStatus status() const;

private:
    enum class Query : std::uint8_t { None, Reset, Serial };

    void transition(SessionStep& st, clock::time_point now, SessionState to, std::string reason);
    void fail(SessionStep& st, clock::time_point now, FailureKind kind, std::string reason, bool full_resync);
    void protocol_error(SessionStep& st, clock::time_point now, ErrorCode code, std::string text);
    void send_query(SessionStep& st, clock::time_point now);
    void restart_with_reset(SessionStep& st, clock::time_point now, std::string reason);
    void begin_delta(SessionStep& st, clock::time_point now, std::string reason);
    bool accept_version(SessionStep& st, clock::time_point now, const Pdu& pdu);
    void clear_stall(SessionStep& st) noexcept;

    void handle(SessionStep& st, clock::time_point now, const SerialNotify& p);
    void handle(SessionStep& st, clock::time_point now, const CacheResponse& p);
    void handle(SessionStep& st, clock::time_point now, const PrefixPdu& p);
    void handle(SessionStep& st, clock::time_point now, const EndOfData& p);
    void handle(SessionStep& st, clock::time_point now, const CacheReset& p);
    void handle(SessionStep& st, clock::time_point now, const ErrorReport& p);

    bool receiving_records() const noexcept {
        return state_ == SessionState::ReceivingFullTable ||
               (state_ == SessionState::ReceivingDelta && response_seen_);
    }

    CacheConfig   cfg_;
    SessionState  state_{SessionState::Disconnected};
    Backoff       backoff_;

    std::uint8_t  version_;
    bool          version_locked_{false};
    std::optional<std::uint16_t> session_id_;
    std::optional<std::uint32_t> serial_;
    bool          resync_required_{true};

    Query         query_{Query::None};
    bool          response_seen_{false};
    std::optional<vrp::VrpTable::Editor> editor_;
    std::shared_ptr<const vrp::VrpTable> committed_;

    std::optional<clock::time_point> deadline_;
    clock::time_point reconnect_at_{};
    clock::time_point last_rx_{};
    clock::time_point sync_started_{};
    std::optional<clock::time_point> last_sync_;
    std::optional<clock::time_point> up_since_;
    bool          stalled_{false};
    std::string   last_error_;

    std::chrono::seconds refresh_;
    std::chrono::seconds retry_;
    std::chrono::seconds expire_;

    // PDU being handled (for Error Report encapsulation).
    const Pdu* cur_pdu_{nullptr};
    std::span<const std::uint8_t> cur_raw_;
};

} // namespace rpkiv::rtr

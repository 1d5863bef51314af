/**
 * @file session_machine.cpp
 * @brief Implementation of SessionMachine.
 */
#include "rpkiv/rtr/session_machine.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>
#include <variant>

namespace rpkiv::rtr {

namespace C = rpkiv::config::constants;

namespace {

bool is_up(SessionState s) noexcept {
    return s == SessionState::Established || s == SessionState::ReceivingDelta;
}

bool is_offline(SessionState s) noexcept {
    return s == SessionState::Disconnected || s == SessionState::Connecting || s == SessionState::Error;
}

std::uint32_t clamp_interval(std::uint32_t v, std::uint32_t lo, std::uint32_t hi) noexcept {
    return std::clamp(v, lo, hi);
}

} // namespace

const char* to_string(SessionState s) noexcept {
    switch (s) {
        case SessionState::Disconnected:          return "Disconnected";
        case SessionState::Connecting:            return "Connecting";
        case SessionState::AwaitingCacheResponse: return "AwaitingCacheResponse";
        case SessionState::ReceivingFullTable:    return "ReceivingFullTable";
        case SessionState::Established:           return "Established";
        case SessionState::ReceivingDelta:        return "ReceivingDelta";
        case SessionState::Error:                 return "Error";
    }
    return "Unknown";
}

SessionMachine::SessionMachine(const CacheConfig& cfg)
    : cfg_(cfg),
      backoff_(cfg.backoff),
      version_(std::min(cfg.protocol_version, C::RTR_VERSION_MAX)),
      refresh_(cfg.timers.refresh),
      retry_(cfg.timers.retry),
      expire_(cfg.timers.expire) {}

bool SessionMachine::healthy() const noexcept {
    return is_up(state_) && !stalled_;
}

// ---------------------------------------------------------------------------
// Internal helpers
// ---------------------------------------------------------------------------

void SessionMachine::transition(SessionStep& st, clock::time_point now, SessionState to, std::string reason) {
    if (to == state_) return;
    const bool was_up = is_up(state_);
    const bool will_up = is_up(to);
    if (was_up && !will_up) {
        up_since_.reset();
        backoff_.on_lost();
    } else if (!was_up && will_up) {
        up_since_ = now;
        backoff_.on_established(now);
    }
    st.transitions.push_back(Transition{state_, to, std::move(reason)});
    state_ = to;
}

void SessionMachine::clear_stall(SessionStep& st) noexcept {
    if (stalled_) {
        stalled_ = false;
        st.health_changed = true;
    }
}

void SessionMachine::fail(SessionStep& st, clock::time_point now, FailureKind kind,
                          std::string reason, bool full_resync) {
    st.close = true;
    st.failure = kind;
    editor_.reset();
    deadline_.reset();
    query_ = Query::None;
    response_seen_ = false;
    if (full_resync) resync_required_ = true;
    clear_stall(st);
    last_error_ = reason;
    transition(st, now, SessionState::Error, std::move(reason));
    const auto delay = std::min<std::chrono::milliseconds>(backoff_.on_failure(), retry_);
    reconnect_at_ = now + delay;
}

void SessionMachine::protocol_error(SessionStep& st, clock::time_point now, ErrorCode code, std::string text) {
    ErrorReport rep;
    rep.version = version_;
    rep.code = static_cast<std::uint16_t>(code);
    rep.text = text;
    if (!cur_raw_.empty()) {
        rep.erroneous_pdu.assign(cur_raw_.begin(), cur_raw_.end());
    } else if (cur_pdu_ != nullptr) {
        rep.erroneous_pdu = encode(*cur_pdu_);
    }
    st.send.emplace_back(std::move(rep));
    fail(st, now, FailureKind::Protocol, std::string(to_string(code)) + ": " + text, true);
}

void SessionMachine::send_query(SessionStep& st, clock::time_point now) {
    if (!resync_required_ && session_id_ && serial_) {
        st.send.emplace_back(SerialQuery{version_, *session_id_, *serial_});
        query_ = Query::Serial;
        transition(st, now, SessionState::AwaitingCacheResponse, "serial query");
    } else {
        st.send.emplace_back(ResetQuery{version_});
        query_ = Query::Reset;
        transition(st, now, SessionState::AwaitingCacheResponse, "reset query");
    }
    response_seen_ = false;
    sync_started_ = now;
    deadline_ = now + cfg_.timers.cache_response;
}

void SessionMachine::restart_with_reset(SessionStep& st, clock::time_point now, std::string reason) {
    editor_.reset();
    resync_required_ = true;
    transition(st, now, SessionState::Connecting, std::move(reason));
    send_query(st, now);
}

void SessionMachine::begin_delta(SessionStep& st, clock::time_point now, std::string reason) {
    st.send.emplace_back(SerialQuery{version_, *session_id_, *serial_});
    query_ = Query::Serial;
    response_seen_ = false;
    sync_started_ = now;
    deadline_ = now + cfg_.timers.response;
    transition(st, now, SessionState::ReceivingDelta, std::move(reason));
}

bool SessionMachine::accept_version(SessionStep& st, clock::time_point now, const Pdu& pdu) {
    const auto v = version_of(pdu);
    const auto type = type_of(pdu);
    if (version_locked_) {
        if (v == version_) return true;
        protocol_error(st, now, ErrorCode::UnexpectedProtocolVersion,
                       "version " + std::to_string(v) + " on a version " +
                       std::to_string(version_) + " session");
        return false;
    }
    // Negotiation: the first Cache Response fixes the version; a lower one is a downgrade.
    if (type == PduType::SerialNotify && v != version_) return false;
    if (type == PduType::CacheResponse && v <= version_) {
        version_ = v;
        version_locked_ = true;
        return true;
    }
    if (v == version_) return true;
    protocol_error(st, now, ErrorCode::UnsupportedProtocolVersion,
                   "version " + std::to_string(v) + " not offered");
    return false;
}

// ---------------------------------------------------------------------------
// Inputs
// ---------------------------------------------------------------------------

SessionStep SessionMachine::start(clock::time_point now) {
    SessionStep st;
    if (state_ != SessionState::Disconnected) return st;
    transition(st, now, SessionState::Connecting, "start");
    st.connect = true;
    return st;
}

SessionStep SessionMachine::on_connected(clock::time_point now) {
    SessionStep st;
    if (state_ != SessionState::Connecting) return st;
    last_rx_ = now;
    send_query(st, now);
    return st;
}

SessionStep SessionMachine::on_connect_failed(clock::time_point now, const TransportError& err) {
    SessionStep st;
    if (state_ != SessionState::Connecting) return st;
    fail(st, now, FailureKind::Transport, "connect: " + err.message, false);
    return st;
}

SessionStep SessionMachine::on_transport_error(clock::time_point now, const TransportError& err) {
    SessionStep st;
    if (is_offline(state_)) return st;
    // Continuity survives a broken stream; the next connection resumes with a Serial Query.
    fail(st, now, FailureKind::Transport, "transport: " + err.message, false);
    return st;
}

SessionStep SessionMachine::on_pdu(clock::time_point now, const Pdu& pdu, std::span<const std::uint8_t> raw) {
    SessionStep st;
    if (is_offline(state_)) return st;
    last_rx_ = now;
    cur_pdu_ = &pdu;
    cur_raw_ = raw;

    if (const auto* rep = std::get_if<ErrorReport>(&pdu)) {
        handle(st, now, *rep);
    } else if (accept_version(st, now, pdu)) {
        std::visit([&](const auto& p) {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, SerialQuery> || std::is_same_v<T, ResetQuery>) {
                protocol_error(st, now, ErrorCode::InvalidRequest, "query PDU received from cache");
            } else if constexpr (std::is_same_v<T, RouterKey> || std::is_same_v<T, Aspa>) {
                // Not used for origin validation; accepted inside a transfer.
                if (!receiving_records()) {
                    protocol_error(st, now, ErrorCode::CorruptData,
                                   std::string(to_string(type_of(pdu))) + " outside a transfer");
                }
            } else {
                handle(st, now, p);
            }
        }, pdu);
    }

    cur_pdu_ = nullptr;
    cur_raw_ = {};
    return st;
}

SessionStep SessionMachine::on_malformed(clock::time_point now, const MalformedPdu& err,
                                         std::span<const std::uint8_t> raw) {
    SessionStep st;
    if (is_offline(state_)) return st;
    const std::string text = std::string("malformed PDU: ") + err.field;
    // Never answer an Error Report with an Error Report.
    const bool about_report = raw.size() > 1 && raw[1] == static_cast<std::uint8_t>(PduType::ErrorReport);
    if (about_report) {
        fail(st, now, FailureKind::Protocol, text, true);
        return st;
    }
    cur_raw_ = raw;
    protocol_error(st, now, err.report, text);
    cur_raw_ = {};
    return st;
}

SessionStep SessionMachine::on_tick(clock::time_point now) {
    SessionStep st;
    switch (state_) {
        case SessionState::Error:
            if (now >= reconnect_at_) {
                transition(st, now, SessionState::Disconnected, "backoff elapsed");
                transition(st, now, SessionState::Connecting, "reconnect");
                st.connect = true;
            }
            return st;
        case SessionState::Established:
            backoff_.maybe_reset(now);
            if (now - last_rx_ >= refresh_) begin_delta(st, now, "refresh interval");
            return st;
        case SessionState::AwaitingCacheResponse:
        case SessionState::ReceivingFullTable:
        case SessionState::ReceivingDelta:
            if (deadline_ && now >= *deadline_) {
                const char* what = "cache response timeout";
                if (receiving_records()) what = "end of data timeout";
                else if (state_ == SessionState::ReceivingDelta) what = "response timeout";
                fail(st, now, FailureKind::Transport, what, false);
                return st;
            }
            if (!stalled_ && now - sync_started_ >= cfg_.timers.sync_stall) {
                stalled_ = true;
                st.health_changed = true;
            }
            return st;
        case SessionState::Disconnected:
        case SessionState::Connecting:
            return st;
    }
    return st;
}

SessionStep SessionMachine::stop(clock::time_point now) {
    SessionStep st;
    if (state_ == SessionState::Disconnected) return st;
    st.close = true;
    editor_.reset();
    deadline_.reset();
    query_ = Query::None;
    response_seen_ = false;
    clear_stall(st);
    transition(st, now, SessionState::Disconnected, "stopped");
    return st;
}

std::optional<SessionMachine::clock::time_point> SessionMachine::next_deadline() const noexcept {
    switch (state_) {
        case SessionState::Error:
            return reconnect_at_;
        case SessionState::Established:
            return last_rx_ + refresh_;
        case SessionState::AwaitingCacheResponse:
        case SessionState::ReceivingFullTable:
        case SessionState::ReceivingDelta: {
            auto t = deadline_.value_or(clock::time_point::max());
            if (!stalled_) t = std::min(t, sync_started_ + cfg_.timers.sync_stall);
            return t;
        }
        case SessionState::Disconnected:
        case SessionState::Connecting:
            break;
    }
    return std::nullopt;
}

SessionStatus SessionMachine::status() const {
    SessionStatus s;
    s.state = state_;
    s.session_id = session_id_;
    s.serial = serial_;
    s.version = version_;
    s.version_locked = version_locked_;
    s.healthy = healthy();
    s.stalled = stalled_;
    s.table = committed_;
    s.last_sync = last_sync_;
    s.up_since = up_since_;
    s.failures = backoff_.failures();
    s.last_error = last_error_;
    s.refresh = refresh_;
    s.retry = retry_;
    s.expire = expire_;
    return s;
}

// ---------------------------------------------------------------------------
// PDU handlers
// ---------------------------------------------------------------------------

void SessionMachine::handle(SessionStep& st, clock::time_point now, const SerialNotify& p) {
    if (state_ != SessionState::Established) return;  // a transfer is already pending
    if (!session_id_ || *session_id_ != p.session_id) {
        restart_with_reset(st, now, "serial notify for another session");
        return;
    }
    if (serial_ && *serial_ == p.serial) return;
    begin_delta(st, now, "serial notify");
}

void SessionMachine::handle(SessionStep& st, clock::time_point now, const CacheResponse& p) {
    if (state_ == SessionState::AwaitingCacheResponse && query_ == Query::Reset) {
        session_id_ = p.session_id;
        editor_.emplace(nullptr);
        deadline_ = now + cfg_.timers.end_of_data;
        transition(st, now, SessionState::ReceivingFullTable, "cache response");
        return;
    }
    const bool delta_pending = (state_ == SessionState::AwaitingCacheResponse && query_ == Query::Serial) ||
                               (state_ == SessionState::ReceivingDelta && !response_seen_);
    if (!delta_pending) {
        protocol_error(st, now, ErrorCode::CorruptData,
                       std::string("unexpected Cache Response in ") + to_string(state_));
        return;
    }
    if (!session_id_ || *session_id_ != p.session_id) {
        protocol_error(st, now, ErrorCode::CorruptData, "Cache Response for another session");
        return;
    }
    editor_.emplace(committed_);
    response_seen_ = true;
    deadline_ = now + cfg_.timers.end_of_data;
    transition(st, now, SessionState::ReceivingDelta, "cache response");
}

void SessionMachine::handle(SessionStep& st, clock::time_point now, const PrefixPdu& p) {
    if (!receiving_records()) {
        protocol_error(st, now, ErrorCode::CorruptData, "prefix outside a transfer");
        return;
    }
    const vrp::Vrp v{p.prefix, p.max_length, p.asn};
    if (state_ == SessionState::ReceivingFullTable && !p.announce) {
        protocol_error(st, now, ErrorCode::CorruptData, "withdrawal during a full transfer");
        return;
    }
    const auto r = p.announce ? editor_->announce(v) : editor_->withdraw(v);
    switch (r) {
        case vrp::EditErr::Ok:
            return;
        case vrp::EditErr::Duplicate:
            protocol_error(st, now, ErrorCode::DuplicateAnnouncement, "duplicate " + v.to_string());
            return;
        case vrp::EditErr::Unknown:
            protocol_error(st, now, ErrorCode::WithdrawalOfUnknownRecord, "unknown " + v.to_string());
            return;
        case vrp::EditErr::Invalid:
            protocol_error(st, now, ErrorCode::CorruptData, "invalid " + v.to_string());
            return;
    }
}

void SessionMachine::handle(SessionStep& st, clock::time_point now, const EndOfData& p) {
    if (!receiving_records()) {
        protocol_error(st, now, ErrorCode::CorruptData, "unexpected End of Data");
        return;
    }
    if (!session_id_ || *session_id_ != p.session_id) {
        protocol_error(st, now, ErrorCode::CorruptData, "End of Data for another session");
        return;
    }
    const bool full = state_ == SessionState::ReceivingFullTable;
    committed_ = std::move(*editor_).commit(p.session_id, p.serial);
    editor_.reset();
    serial_ = p.serial;
    resync_required_ = false;
    query_ = Query::None;
    response_seen_ = false;
    deadline_.reset();
    last_sync_ = now;
    last_rx_ = now;
    clear_stall(st);

    if (p.version >= 1) {
        if (cfg_.timers.honor_cache_refresh) {
            refresh_ = std::chrono::seconds{clamp_interval(p.refresh_interval, C::RTR_REFRESH_MIN_S, C::RTR_REFRESH_MAX_S)};
            retry_ = std::chrono::seconds{clamp_interval(p.retry_interval, C::RTR_RETRY_MIN_S, C::RTR_RETRY_MAX_S)};
            expire_ = std::chrono::seconds{clamp_interval(p.expire_interval, C::RTR_EXPIRE_MIN_S, C::RTR_EXPIRE_MAX_S)};
        }
    }

    st.commit = committed_;
    st.full_sync = full;
    transition(st, now, SessionState::Established, "end of data serial " + std::to_string(p.serial));
}

void SessionMachine::handle(SessionStep& st, clock::time_point now, const CacheReset&) {
    const bool answering_serial = (state_ == SessionState::AwaitingCacheResponse && query_ == Query::Serial) ||
                                  (state_ == SessionState::ReceivingDelta && !response_seen_) ||
                                  state_ == SessionState::Established;
    if (!answering_serial) {
        protocol_error(st, now, ErrorCode::CorruptData,
                       std::string("unexpected Cache Reset in ") + to_string(state_));
        return;
    }
    st.cache_reset = true;
    restart_with_reset(st, now, "cache reset");
}

void SessionMachine::handle(SessionStep& st, clock::time_point now, const ErrorReport& p) {
    const auto code = static_cast<ErrorCode>(p.code);
    const std::string what = std::string("cache error ") + to_string(code) +
                             (p.text.empty() ? std::string() : ": " + p.text);

    // Version negotiation: retry at a lower version on a fresh connection, without backoff.
    if (code == ErrorCode::UnsupportedProtocolVersion && !version_locked_ && version_ > C::RTR_VERSION_MIN) {
        version_ = p.version < version_ ? p.version : static_cast<std::uint8_t>(version_ - 1);
        st.close = true;
        editor_.reset();
        deadline_.reset();
        query_ = Query::None;
        last_error_ = what;
        transition(st, now, SessionState::Disconnected, "downgrade to version " + std::to_string(version_));
        transition(st, now, SessionState::Connecting, "reconnect");
        st.connect = true;
        return;
    }
    fail(st, now, FailureKind::CacheSignaled, what, true);
}

} // namespace rpkiv::rtr

/**
 * @file session.cpp
 * @brief RtrSession thread loop.
 */
#include "rpkiv/rtr/session.hpp"

#include <algorithm>
#include <utility>

#include "rpkiv/config/constants.hpp"

namespace rpkiv::rtr {

namespace C = rpkiv::config::constants;

RtrSession::RtrSession(std::size_t index, CacheConfig cfg, std::unique_ptr<Connector> connector,
                       Publisher publish, obs::Observer* observer)
    : index_(index),
      cfg_(std::move(cfg)),
      connector_(std::move(connector)),
      publish_(std::move(publish)),
      obs_(observer ? observer : obs::make_log_observer()),
      machine_(cfg_) {
    status_ = machine_.status();
}

RtrSession::~RtrSession() { stop(); }

void RtrSession::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) return;
    stop_.store(false, std::memory_order_release);
    th_ = std::thread([this] { run(); });
}

void RtrSession::stop() {
    stop_.store(true, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (transport_) transport_->cancel();
    }
    connector_->cancel();
    cv_.notify_all();
    if (th_.joinable()) th_.join();
    running_.store(false, std::memory_order_release);
}

SessionStatus RtrSession::status() const {
    std::lock_guard<std::mutex> lk(mu_);
    return status_;
}

void RtrSession::run() {
    obs::logger()->info("session {} ({}) starting", cfg_.name, connector_->describe());
    execute(machine_.start(clock::now()));
    while (!stop_.load(std::memory_order_acquire)) {
        flush_pending();
        if (connect_pending_) {
            do_connect();
        } else if (transport_) {
            pump();
        } else {
            idle();
        }
        if (stop_.load(std::memory_order_acquire)) break;
        execute(machine_.on_tick(clock::now()));
    }
    execute(machine_.stop(clock::now()));
    obs::logger()->info("session {} stopped", cfg_.name);
}

std::chrono::milliseconds RtrSession::wait_budget(clock::time_point now) const {
    std::chrono::milliseconds budget{C::SESSION_POLL_INTERVAL_MS};
    if (auto d = machine_.next_deadline()) {
        auto until = std::chrono::duration_cast<std::chrono::milliseconds>(*d - now);
        budget = std::min(budget, until);
    }
    return std::max(budget, std::chrono::milliseconds{1});
}

void RtrSession::do_connect() {
    connect_pending_ = false;
    auto r = connector_->connect(cfg_.timers.connect);
    if (stop_.load(std::memory_order_acquire)) return;
    if (!r) {
        obs::logger()->warn("session {}: {}", cfg_.name, r.error().message);
        execute(machine_.on_connect_failed(clock::now(), r.error()));
        return;
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        transport_ = std::move(*r);
        if (stop_.load(std::memory_order_acquire)) transport_->cancel();
    }
    framer_.clear();
    execute(machine_.on_connected(clock::now()));
}

void RtrSession::pump() {
    auto r = transport_->read_some(rxbuf_, wait_budget(clock::now()));
    if (!r) {
        const auto& err = r.error();
        if (err.kind == TransportError::Kind::Timeout) return;
        if (err.kind == TransportError::Kind::Cancelled && stop_.load(std::memory_order_acquire)) return;
        obs::logger()->warn("session {}: {}", cfg_.name, err.message);
        execute(machine_.on_transport_error(clock::now(), err));
        return;
    }
    framer_.feed(std::span<const std::uint8_t>(rxbuf_.data(), *r));
    while (transport_) {
        auto frame = framer_.next();
        if (!frame) break;
        obs_->count(obs::Counter::PdusReceived);
        const auto now = clock::now();
        if (frame->pdu) {
            execute(machine_.on_pdu(now, *frame->pdu, frame->raw));
        } else {
            const auto& bad = frame->pdu.error();
            obs::logger()->warn("session {}: malformed PDU ({}, field {})",
                                cfg_.name, to_string(bad.report), bad.field);
            execute(machine_.on_malformed(now, bad, frame->raw));
        }
    }
}

void RtrSession::idle() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, wait_budget(clock::now()), [this] { return stop_.load(std::memory_order_acquire); });
}

void RtrSession::execute(SessionStep step) {
    std::optional<TransportError> write_err;
    if (transport_) {
        for (const auto& pdu : step.send) {
            auto w = transport_->write_all(encode(pdu), cfg_.timers.response);
            if (!w) {
                write_err = w.error();
                break;
            }
            obs_->count(obs::Counter::PdusSent);
        }
    }
    if (step.close) {
        std::unique_ptr<Transport> dead;
        {
            std::lock_guard<std::mutex> lk(mu_);
            dead = std::move(transport_);
        }
        if (dead) dead->close();
        framer_.clear();
    }
    if (step.connect) connect_pending_ = true;

    switch (step.failure) {
        case FailureKind::Transport:     obs_->count(obs::Counter::TransportErrors); break;
        case FailureKind::Protocol:      obs_->count(obs::Counter::ProtocolErrors); break;
        case FailureKind::CacheSignaled: obs_->count(obs::Counter::CacheErrors); break;
        case FailureKind::None:          break;
    }
    if (step.cache_reset) obs_->count(obs::Counter::CacheResets);
    if (step.commit) obs_->count(step.full_sync ? obs::Counter::FullSyncs : obs::Counter::Deltas);

    const auto serial = machine_.serial().value_or(0);
    for (const auto& t : step.transitions) {
        obs_->record(obs::SessionEvent{cfg_.name, to_string(t.from), to_string(t.to), t.reason, serial});
    }
    if (step.health_changed) {
        obs::logger()->warn("session {}: {}", cfg_.name,
                            machine_.status().stalled ? "synchronisation stalled" : "synchronisation recovered");
    }

    if (step.reportable()) {
        SessionUpdate up{index_, machine_.status(), step.commit != nullptr};
        {
            std::lock_guard<std::mutex> lk(mu_);
            status_ = up.status;
        }
        if (pending_) up.committed = up.committed || pending_->committed;
        pending_ = std::move(up);
        flush_pending();
    }

    if (write_err) {
        obs::logger()->warn("session {}: write failed: {}", cfg_.name, write_err->message);
        execute(machine_.on_transport_error(clock::now(), *write_err));
    }
}

void RtrSession::flush_pending() {
    if (!pending_ || !publish_) return;
    if (publish_(*pending_)) pending_.reset();
}

} // namespace rpkiv::rtr

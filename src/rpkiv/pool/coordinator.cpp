/**
 * @file coordinator.cpp
 * @brief Implementation of Coordinator.
 */
#include "rpkiv/pool/coordinator.hpp"

#include <utility>

namespace rpkiv::pool {

using clock = std::chrono::steady_clock;

const char* to_string(ValidateErr e) noexcept {
    switch (e) {
        case ValidateErr::NoData:            return "no_data";
        case ValidateErr::StalenessExceeded: return "staleness_exceeded";
    }
    return "unknown";
}

Coordinator::Coordinator(PoolConfig cfg, std::vector<Member> members, vrp::VrpStore& store,
                         EventSink& sink, obs::Observer* observer)
    : cfg_(cfg),
      policy_(AuthorityConfig{cfg.min_hold, cfg.recovery_hold}),
      store_(store),
      sink_(sink),
      obs_(observer ? observer : obs::make_log_observer()) {
    views_.reserve(members.size());
    for (std::size_t i = 0; i < members.size(); ++i) {
        SessionView v;
        v.index = i;
        v.name = std::move(members[i].name);
        v.preference = members[i].preference;
        views_.push_back(std::move(v));
    }
}

Health Coordinator::classify(const rtr::SessionStatus& s, clock::time_point now) const noexcept {
    if (!s.table || !s.last_sync) return Health::Down;
    if (now - *s.last_sync >= cfg_.staleness_ceiling) return Health::Down;
    if (s.healthy) return Health::Up;
    return s.usable(now) ? Health::Degraded : Health::Down;
}

void Coordinator::apply(const rtr::SessionUpdate& u) {
    if (u.index >= views_.size()) {
        obs::logger()->warn("coordinator: update for unknown session index {}", u.index);
        return;
    }
    std::lock_guard<std::mutex> lk(mu_);
    views_[u.index].status = u.status;
}

void Coordinator::evaluate(clock::time_point now) {
    std::vector<Candidate> candidates;
    candidates.reserve(views_.size());
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& v : views_) {
            v.health = classify(v.status, now);
            candidates.push_back(Candidate{v.index, v.preference, v.health, v.status.up_since, v.status.last_sync});
        }
    }

    if (auto d = policy_.evaluate(authority_, candidates, last_switch_, now)) {
        const auto prev = authority_;
        {
            std::lock_guard<std::mutex> lk(mu_);
            authority_ = d->index;
        }
        last_switch_ = now;
        if (prev) {
            obs_->count(obs::Counter::Failovers);
            obs::logger()->warn("authority {} -> {} ({})", views_[*prev].name, views_[d->index].name, d->reason);
        } else {
            obs::logger()->info("authority -> {} ({})", views_[d->index].name, d->reason);
        }
        publish_from(d->index, now);
    } else if (authority_ && views_[*authority_].health != Health::Down) {
        publish_from(*authority_, now);
    }

    const auto snap = store_.current();
    if (snap->table && now - snap->synced_at >= cfg_.staleness_ceiling) {
        withdraw("staleness ceiling exceeded");
    }
}

void Coordinator::publish_from(std::size_t index, clock::time_point now) {
    const auto& st = views_[index].status;
    if (!st.table || !st.last_sync || st.table == published_) return;
    if (now - *st.last_sync >= cfg_.staleness_ceiling) return;
    const auto version = store_.publish(st.table, *st.last_sync, index);
    published_ = st.table;
    obs_->count(obs::Counter::Publishes);
    obs::logger()->info("published version {} from {} (serial {}, {} VRPs)",
                        version, views_[index].name, st.table->serial(), st.table->size());
    sink_.notify(version);
}

void Coordinator::withdraw(const char* reason) {
    const auto version = store_.withdraw();
    published_.reset();
    obs_->count(obs::Counter::Withdrawals);
    obs::logger()->warn("validation data withdrawn at version {}: {}", version, reason);
    sink_.notify(version);
}

PoolStatus Coordinator::status(clock::time_point now) const {
    PoolStatus ps;
    {
        std::lock_guard<std::mutex> lk(mu_);
        ps.sessions = views_;
        ps.authoritative = authority_;
    }
    const auto snap = store_.current();
    ps.version = snap->version;
    if (snap->table) {
        const auto age = now - snap->synced_at;
        ps.serial = snap->table->serial();
        ps.staleness = std::chrono::duration_cast<std::chrono::seconds>(age);
        ps.available = age < cfg_.staleness_ceiling;
    }
    return ps;
}

rpkiv_detail::expected<vrp::ValidationResult, ValidateErr>
Coordinator::validate(const net::IpPrefix& route, std::uint32_t origin_as, clock::time_point now) const {
    const auto snap = store_.current();
    if (!snap->table) return rpkiv_detail::unexpected(ValidateErr::NoData);
    if (now - snap->synced_at >= cfg_.staleness_ceiling) return rpkiv_detail::unexpected(ValidateErr::StalenessExceeded);
    return vrp::validate(*snap->table, route, origin_as);
}

std::optional<std::size_t> Coordinator::authority() const {
    std::lock_guard<std::mutex> lk(mu_);
    return authority_;
}

} // namespace rpkiv::pool

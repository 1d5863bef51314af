/**
 * @file authority_policy.cpp
 * @brief Implementation of AuthorityPolicy and helpers.
 */
#include "rpkiv/pool/authority_policy.hpp"

namespace rpkiv::pool {

const char* to_string(Health h) noexcept {
    switch (h) {
        case Health::Up:       return "up";
        case Health::Degraded: return "degraded";
        case Health::Down:     return "down";
    }
    return "unknown";
}

static const Candidate* find(const std::vector<Candidate>& v, std::optional<std::size_t> index) {
    if (!index) return nullptr;
    for (const auto& c : v) if (c.index == *index) return &c;
    return nullptr;
}

static bool better(const Candidate& a, const Candidate& b) {
    if (a.preference != b.preference) return a.preference < b.preference;
    const auto as = a.last_sync.value_or(std::chrono::steady_clock::time_point{});
    const auto bs = b.last_sync.value_or(std::chrono::steady_clock::time_point{});
    if (as != bs) return as > bs;
    return a.index < b.index;
}

const Candidate* AuthorityPolicy::best_of(const std::vector<Candidate>& v, Health h) {
    const Candidate* best = nullptr;
    for (const auto& c : v) {
        if (c.health != h) continue;
        if (!best || better(c, *best)) best = &c;
    }
    return best;
}

bool AuthorityPolicy::held(std::optional<std::chrono::steady_clock::time_point> since,
                           std::chrono::steady_clock::time_point now,
                           std::chrono::milliseconds hold) noexcept {
    return !since || now - *since >= hold;
}

std::optional<AuthorityDecision>
AuthorityPolicy::evaluate(std::optional<std::size_t> current,
                          const std::vector<Candidate>& candidates,
                          std::chrono::steady_clock::time_point last_switch,
                          std::chrono::steady_clock::time_point now) const {
    const Candidate* cur = find(candidates, current);
    const auto cur_health = cur ? cur->health : Health::Down;
    const Candidate* best_up = best_of(candidates, Health::Up);

    // Current not Up → move to the best Up session immediately
    if (cur_health != Health::Up) {
        if (best_up) {
            return AuthorityDecision{best_up->index, cur ? "current_unhealthy" : "initial"};
        }
        // Nothing Up: stale-but-valid. Keep a Degraded authority; replace a Down one.
        if (cur_health == Health::Degraded) return std::nullopt;
        if (const Candidate* best_deg = best_of(candidates, Health::Degraded)) {
            if (cur && best_deg->index == cur->index) return std::nullopt;
            return AuthorityDecision{best_deg->index, "stale_fallback"};
        }
        return std::nullopt; // nothing to do
    }

    // Current Up: only return to a more preferred session after recovery hold + min hold
    if (best_up && best_up->index != cur->index && best_up->preference < cur->preference &&
        held(best_up->up_since, now, cfg_.recovery_hold) &&
        (last_switch.time_since_epoch().count() == 0 || now - last_switch >= cfg_.min_hold)) {
        return AuthorityDecision{best_up->index, "return_to_preferred"};
    }

    return std::nullopt; // keep current
}

} // namespace rpkiv::pool

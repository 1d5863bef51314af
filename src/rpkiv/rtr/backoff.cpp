/**
 * @file backoff.cpp
 * @brief Implementation of Backoff.
 */
#include "rpkiv/rtr/backoff.hpp"

#include <algorithm>

namespace rpkiv::rtr {

std::chrono::milliseconds Backoff::peek() const noexcept {
    using std::chrono::milliseconds;
    // delay = base * 2^failures, saturating at max (shift bounded to avoid overflow)
    const auto shift = std::min<std::uint32_t>(failures_, 30);
    const auto base = std::max<milliseconds::rep>(cfg_.base.count(), 1);
    const auto cap = std::max(cfg_.max.count(), base);
    const auto scaled = base > (cap >> shift) ? cap : (base << shift);
    return milliseconds{std::min(scaled, cap)};
}

std::chrono::milliseconds Backoff::on_failure() noexcept {
    const auto d = peek();
    ++failures_;
    up_since_.reset();
    return d;
}

bool Backoff::maybe_reset(clock::time_point now) noexcept {
    if (!up_since_ || failures_ == 0) return false;
    if (now - *up_since_ < cfg_.reset_after) return false;
    failures_ = 0;
    return true;
}

} // namespace rpkiv::rtr

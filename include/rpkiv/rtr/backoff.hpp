#pragma once
/**
 * @file backoff.hpp
 * @brief Reconnect delay: base doubling per consecutive failure, capped, reset after sustained success.
 */

#include <chrono>
#include <cstdint>
#include <optional>

#include "rpkiv/rtr/session_config.hpp"

namespace rpkiv::rtr {

class Backoff {
public:
    using clock = std::chrono::steady_clock;

    explicit Backoff(BackoffConfig cfg) noexcept : cfg_(cfg) {}

    /// Count a failure and return the delay before the next attempt.
    std::chrono::milliseconds on_failure() noexcept;

    /// Session reached Established at @p now.
    void on_established(clock::time_point now) noexcept { up_since_ = now; }

    /// Session left Established.
    void on_lost() noexcept { up_since_.reset(); }

    /// Forget failures once the session has been up for reset_after. Returns true if it reset.
    bool maybe_reset(clock::time_point now) noexcept;

    /// Delay the next failure would produce.
    [[nodiscard]] std::chrono::milliseconds peek() const noexcept;

    [[nodiscard]] std::uint32_t failures() const noexcept { return failures_; }

    /// @return Current configuration (by const reference).
    const BackoffConfig& config() const noexcept { return cfg_; }

private:
    BackoffConfig cfg_;
    std::uint32_t failures_{0};
    std::optional<clock::time_point> up_since_;
};

} // namespace rpkiv::rtr

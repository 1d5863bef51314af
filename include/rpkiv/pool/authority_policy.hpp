#pragma once
/**
 * @file authority_policy.hpp
 * @brief Chooses the authoritative cache session, with hysteresis and return-to-preferred.
 * @details All defaults are named in constants.hpp to avoid magic numbers.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "rpkiv/config/constants.hpp"

namespace rpkiv::pool {

/** @enum Health
 *  @brief High-level health classification of a session.
 */
enum class Health : std::uint8_t {
    Up,        ///< Synchronised and not stalled
    Degraded,  ///< Not synchronised, but holds a table that is still usable
    Down       ///< Nothing usable
};

const char* to_string(Health h) noexcept;

/** @struct AuthorityConfig
 *  @brief Hysteresis for authority switches.
 */
struct AuthorityConfig {
    std::chrono::milliseconds min_hold{rpkiv::config::constants::POOL_MIN_HOLD_MS};          ///< Dwell between switches
    std::chrono::milliseconds recovery_hold{rpkiv::config::constants::POOL_RECOVERY_HOLD_MS}; ///< Preferred must be Up this long
};

/** @struct Candidate
 *  @brief What the policy knows about one session.
 */
struct Candidate {
    std::size_t index{0};
    int         preference{rpkiv::config::constants::POOL_PREFERENCE_DEFAULT}; ///< Lower is preferred
    Health      health{Health::Down};
    std::optional<std::chrono::steady_clock::time_point> up_since;   ///< Set while Up
    std::optional<std::chrono::steady_clock::time_point> last_sync;  ///< Last End of Data
};

/** @struct AuthorityDecision
 *  @brief Result of an authority evaluation.
 */
struct AuthorityDecision {
    std::size_t index{0}; ///< Session to make authoritative
    std::string reason;   ///< Human/observability reason string
};

/** @class AuthorityPolicy
 *  @brief Decides whether/when to move authority between sessions.
 */
class AuthorityPolicy {
public:
    explicit AuthorityPolicy(AuthorityConfig cfg) noexcept : cfg_(cfg) {}

    /**
     * @brief Evaluate the need to switch from the current authority.
     * @param current Current authoritative session, if any.
     * @param candidates One entry per session.
     * @param last_switch Time of the previous switch (epoch if none).
     * @param now Monotonic time for hysteresis checks.
     * @return A decision if a switch is recommended; std::nullopt to keep current.
     */
    std::optional<AuthorityDecision>
    evaluate(std::optional<std::size_t> current,
             const std::vector<Candidate>& candidates,
             std::chrono::steady_clock::time_point last_switch,
             std::chrono::steady_clock::time_point now) const;

    /// @return Current configuration (by const reference).
    const AuthorityConfig& config() const noexcept { return cfg_; }

    /// Replace the configuration.
    void update_config(AuthorityConfig c) noexcept { cfg_ = c; }

private:
    /// Best candidate in @p h: lowest preference, then freshest sync, then lowest index.
    static const Candidate* best_of(const std::vector<Candidate>& v, Health h);

    /// Check dwell/hold timers to allow switching.
    static bool held(std::optional<std::chrono::steady_clock::time_point> since,
                     std::chrono::steady_clock::time_point now,
                     std::chrono::milliseconds hold) noexcept;

private:
    AuthorityConfig cfg_{};
};

} // namespace rpkiv::pool

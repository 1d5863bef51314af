#pragma once
/**
 * @file coordinator.hpp
 * @brief Single writer of the VRP store: picks the authoritative session and republishes its snapshot.
 *
 * Threading:
 *   - apply() and evaluate() are called from one thread only (the coordinator thread).
 *   - status() may be called from any thread.
 *   - validate() is lock-free: it only reads the store's current snapshot.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "rpkiv/compat/expected.hpp"
#include "rpkiv/config/constants.hpp"
#include "rpkiv/net/ip_prefix.hpp"
#include "rpkiv/obs/observability.hpp"
#include "rpkiv/pool/authority_policy.hpp"
#include "rpkiv/pool/event_sink.hpp"
#include "rpkiv/rtr/session.hpp"
#include "rpkiv/vrp/validation.hpp"
#include "rpkiv/vrp/vrp_store.hpp"

namespace rpkiv::pool {

/** @struct PoolConfig
 *  @brief Coordinator tuning.
 */
struct PoolConfig {
    std::chrono::seconds      staleness_ceiling{rpkiv::config::constants::POOL_STALENESS_CEILING_S}; ///< Max age of served data
    std::chrono::milliseconds min_hold{rpkiv::config::constants::POOL_MIN_HOLD_MS};
    std::chrono::milliseconds recovery_hold{rpkiv::config::constants::POOL_RECOVERY_HOLD_MS};
    std::chrono::milliseconds tick{rpkiv::config::constants::POOL_TICK_MS};                        ///< Drain/evaluate period
    std::size_t               queue_capacity{rpkiv::config::constants::POOL_UPDATE_QUEUE_CAP};     ///< Per-session ring (power of two)
};

/// Why validate() could not answer.
enum class ValidateErr : std::uint8_t {
    NoData,             ///< Nothing has been published, or data was withdrawn
    StalenessExceeded   ///< Published data is older than the staleness ceiling
};

const char* to_string(ValidateErr e) noexcept;

/** @struct SessionView
 *  @brief Coordinator's view of one session.
 */
struct SessionView {
    std::size_t        index{0};
    std::string        name;
    int                preference{rpkiv::config::constants::POOL_PREFERENCE_DEFAULT};
    rtr::SessionStatus status{};
    Health             health{Health::Down};
};

/** @struct PoolStatus
 *  @brief Health/observability surface of the whole pool.
 */
struct PoolStatus {
    std::vector<SessionView>     sessions;
    std::optional<std::size_t>   authoritative;  ///< Index into sessions
    std::optional<std::uint32_t> serial;         ///< Serial of the published table
    std::optional<std::chrono::seconds> staleness; ///< Age of the published table
    bool                         available{false};
    std::uint64_t                version{0};     ///< Store version
};

class Coordinator {
public:
    /// Static description of a session.
    struct Member {
        std::string name;
        int         preference{rpkiv::config::constants::POOL_PREFERENCE_DEFAULT};
    };

    Coordinator(PoolConfig cfg, std::vector<Member> members, vrp::VrpStore& store,
                EventSink& sink, obs::Observer* observer = nullptr);

    /// Record a session update. Takes effect at the next evaluate().
    void apply(const rtr::SessionUpdate& u);

    /// Re-evaluate authority, publish the authority's newest table, enforce the staleness ceiling.
    void evaluate(std::chrono::steady_clock::time_point now);

    [[nodiscard]] PoolStatus status(std::chrono::steady_clock::time_point now) const;

    /// Validate against the published snapshot.
    rpkiv_detail::expected<vrp::ValidationResult, ValidateErr>
    validate(const net::IpPrefix& route, std::uint32_t origin_as,
             std::chrono::steady_clock::time_point now) const;

    [[nodiscard]] std::optional<std::size_t> authority() const;

    const PoolConfig& config() const noexcept { return cfg_; }

private:
    Health classify(const rtr::SessionStatus& s, std::chrono::steady_clock::time_point now) const noexcept;
    void publish_from(std::size_t index, std::chrono::steady_clock::time_point now);
    void withdraw(const char* reason);

    PoolConfig      cfg_;
    AuthorityPolicy policy_;
    vrp::VrpStore&  store_;
    EventSink&      sink_;
    obs::Observer*  obs_;

    mutable std::mutex mu_;   ///< Guards views_ and authority_ for status()
    std::vector<SessionView> views_;
    std::optional<std::size_t> authority_;
    std::chrono::steady_clock::time_point last_switch_{};
    std::shared_ptr<const vrp::VrpTable> published_;  ///< Table behind the store's current snapshot
};

} // namespace rpkiv::pool

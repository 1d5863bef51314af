#pragma once
/**
 * @file session_config.hpp
 * @brief Per-cache configuration consumed by sessions and connectors.
 * @details All defaults are named in constants.hpp to avoid magic numbers.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "rpkiv/config/constants.hpp"

namespace rpkiv::rtr {

/** @struct SessionTimers
 *  @brief Bounded waits of the session state machine.
 */
struct SessionTimers {
    std::chrono::milliseconds connect{rpkiv::config::constants::SESSION_CONNECT_TIMEOUT_MS};
    std::chrono::milliseconds cache_response{rpkiv::config::constants::SESSION_CACHE_RESPONSE_TIMEOUT_MS};
    std::chrono::milliseconds end_of_data{rpkiv::config::constants::SESSION_END_OF_DATA_TIMEOUT_MS};
    std::chrono::milliseconds response{rpkiv::config::constants::SESSION_RESPONSE_TIMEOUT_MS};   ///< Keepalive reply
    std::chrono::seconds      refresh{rpkiv::config::constants::RTR_REFRESH_DEFAULT_S};           ///< Quiet interval
    std::chrono::seconds      retry{rpkiv::config::constants::RTR_RETRY_DEFAULT_S};               ///< Ceiling on reconnect delay
    std::chrono::seconds      expire{rpkiv::config::constants::RTR_EXPIRE_DEFAULT_S};             ///< Data unusable this long after last sync
    std::chrono::milliseconds sync_stall{rpkiv::config::constants::SESSION_SYNC_STALL_MS};
    bool                      honor_cache_refresh{true};  ///< Adopt End of Data intervals (v1+)
};

/** @struct BackoffConfig
 *  @brief Exponential reconnect delay.
 */
struct BackoffConfig {
    std::chrono::milliseconds base{rpkiv::config::constants::BACKOFF_BASE_MS};
    std::chrono::milliseconds max{rpkiv::config::constants::BACKOFF_MAX_MS};
    std::chrono::milliseconds reset_after{rpkiv::config::constants::BACKOFF_RESET_AFTER_MS};
};

/** @struct Credentials
 *  @brief Optional transport credentials (used by SSH/TLS connectors).
 */
struct Credentials {
    std::string username;
    std::string password;
};

/** @struct CacheConfig
 *  @brief One RTR cache to synchronise with.
 */
struct CacheConfig {
    std::string   name;                                              ///< Unique label for logs/status
    std::string   host;
    std::uint16_t port{rpkiv::config::constants::RTR_PORT_DEFAULT};
    int           preference{rpkiv::config::constants::POOL_PREFERENCE_DEFAULT}; ///< Lower is preferred
    std::uint8_t  protocol_version{rpkiv::config::constants::RTR_VERSION_DEFAULT}; ///< Highest version to offer
    std::optional<Credentials> credentials;
    SessionTimers timers{};
    BackoffConfig backoff{};
};

} // namespace rpkiv::rtr

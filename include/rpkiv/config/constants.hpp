#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the RTR client and coordinator.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (JSON) in production deployments.
 */

#include <cstddef>
#include <cstdint>

namespace rpkiv::config::constants {

// =====================
// RTR protocol (RFC 6810 / RFC 8210 / draft-ietf-sidrops-8210bis)
// =====================
inline constexpr uint8_t  RTR_VERSION_MIN        = 0;     ///< RFC 6810
inline constexpr uint8_t  RTR_VERSION_MAX        = 2;     ///< 8210bis (ASPA)
inline constexpr uint8_t  RTR_VERSION_DEFAULT    = 1;     ///< RFC 8210, widest cache support
inline constexpr uint16_t RTR_PORT_DEFAULT       = 323;   ///< IANA rpki-rtr
inline constexpr std::size_t RTR_HEADER_LEN      = 8;     ///< version, type, session/flags, length
inline constexpr std::size_t RTR_MAX_PDU_LEN     = 65536; ///< Framing ceiling (Error Report / ASPA bound)

// =====================
// RFC 8210 §6 timing parameter ranges and defaults (seconds)
// =====================
inline constexpr uint32_t RTR_REFRESH_MIN_S      = 1;
inline constexpr uint32_t RTR_REFRESH_MAX_S      = 86400;
inline constexpr uint32_t RTR_REFRESH_DEFAULT_S  = 3600;
inline constexpr uint32_t RTR_RETRY_MIN_S        = 1;
inline constexpr uint32_t RTR_RETRY_MAX_S        = 7200;
inline constexpr uint32_t RTR_RETRY_DEFAULT_S    = 600;
inline constexpr uint32_t RTR_EXPIRE_MIN_S       = 600;
inline constexpr uint32_t RTR_EXPIRE_MAX_S       = 172800;
inline constexpr uint32_t RTR_EXPIRE_DEFAULT_S   = 7200;

// =====================
// Session timeouts (milliseconds)
// =====================
inline constexpr uint32_t SESSION_CONNECT_TIMEOUT_MS        = 10000;  ///< TCP connect
inline constexpr uint32_t SESSION_CACHE_RESPONSE_TIMEOUT_MS = 30000;  ///< Query → Cache Response
inline constexpr uint32_t SESSION_END_OF_DATA_TIMEOUT_MS    = 600000; ///< Cache Response → End of Data
inline constexpr uint32_t SESSION_RESPONSE_TIMEOUT_MS       = 30000;  ///< Keepalive Serial Query → any reply
inline constexpr uint32_t SESSION_SYNC_STALL_MS             = 120000; ///< Full sync slower than this is unhealthy
inline constexpr uint32_t SESSION_POLL_INTERVAL_MS          = 200;    ///< Upper bound on one blocking read

// =====================
// Reconnect backoff (milliseconds)
// =====================
inline constexpr uint32_t BACKOFF_BASE_MS        = 1000;   ///< First retry delay
inline constexpr uint32_t BACKOFF_MAX_MS         = 300000; ///< Cap (5 min)
inline constexpr uint32_t BACKOFF_RESET_AFTER_MS = 60000;  ///< Established this long → failures forgotten

// =====================
// Coordinator defaults
// =====================
inline constexpr uint32_t POOL_STALENESS_CEILING_S = RTR_EXPIRE_DEFAULT_S; ///< Beyond this, validation is unavailable
inline constexpr uint32_t POOL_MIN_HOLD_MS         = 3000;   ///< Dwell between authority switches
inline constexpr uint32_t POOL_RECOVERY_HOLD_MS    = 30000;  ///< Preferred cache must stay healthy this long
inline constexpr uint32_t POOL_TICK_MS             = 100;    ///< Coordinator drain/evaluate period
inline constexpr std::size_t POOL_UPDATE_QUEUE_CAP = 256;    ///< Per-session SPSC ring (power of two)
inline constexpr int      POOL_PREFERENCE_DEFAULT  = 100;    ///< Lower is preferred

} // namespace rpkiv::config::constants

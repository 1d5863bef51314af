#pragma once
/**
 * @file config_loader.hpp
 * @brief JSON configuration loader (jsoncpp).
 * @details Absent keys keep the named defaults from constants.hpp. Unknown keys
 *          are logged and ignored; malformed or out-of-range values are errors.
 *
 * Document shape:
 * @code
 * {
 *   "log":    { "level": "info", "pattern": "..." },
 *   "pool":   { "staleness_ceiling_s": 7200, "min_hold_ms": 3000, "recovery_hold_ms": 30000,
 *               "tick_ms": 100, "queue_capacity": 256 },
 *   "caches": [ { "name": "a", "host": "rtr.example.net", "port": 323, "preference": 100,
 *                 "protocol_version": 1, "credentials": { "username": "", "password": "" },
 *                 "timers":  { "connect_ms", "cache_response_ms", "end_of_data_ms", "response_ms",
 *                              "sync_stall_ms", "refresh_s", "retry_s", "expire_s",
 *                              "honor_cache_intervals" },
 *                 "backoff": { "base_ms", "max_ms", "reset_after_ms" } } ]
 * }
 * @endcode
 */

#include <string>
#include <vector>

#include "rpkiv/compat/expected.hpp"
#include "rpkiv/obs/observability.hpp"
#include "rpkiv/pool/coordinator.hpp"
#include "rpkiv/rtr/session_config.hpp"

namespace rpkiv::config {

    /** @struct ValidatorConfig
     *  @brief Aggregate of sub-configs required by the validator process.
     */
    struct ValidatorConfig {
        std::vector<rpkiv::rtr::CacheConfig> caches; ///< One session per entry
        rpkiv::pool::PoolConfig              pool;   ///< Coordinator tuning
        rpkiv::obs::LogConfig                log;    ///< Logger setup
    };

    /** @struct ConfigError
     *  @brief Where and why a document was rejected.
     */
    struct ConfigError {
        std::string path;     ///< JSON path, e.g. "caches[1].timers.refresh_s"
        std::string message;

        std::string to_string() const { return path.empty() ? message : path + ": " + message; }
    };

    /** @class Loader
     *  @brief Source of validator configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// Read and parse @p path.
        static rpkiv_detail::expected<ValidatorConfig, ConfigError> load_from_file(const std::string& path);

        /// Parse a JSON document.
        static rpkiv_detail::expected<ValidatorConfig, ConfigError> parse(const std::string& text);

        /// Named defaults with a single cache on localhost.
        static ValidatorConfig defaults();
    };

} // namespace rpkiv::config

#pragma once
/**
 * @file validation.hpp
 * @brief Route origin validation (RFC 6811) against a VRP snapshot.
 */

#include <cstdint>

#include "rpkiv/net/ip_prefix.hpp"
#include "rpkiv/vrp/vrp.hpp"
#include "rpkiv/vrp/vrp_table.hpp"

namespace rpkiv::vrp {

/** @enum Validity
 *  @brief Outcome of origin validation.
 */
enum class Validity : std::uint8_t {
    Valid,     ///< Some covering VRP matches both origin AS and length
    NotFound,  ///< No VRP covers the route
    Invalid    ///< Covered, but no covering VRP matches
};

const char* to_string(Validity v) noexcept;

/** @struct ValidationResult
 *  @brief Verdict plus the VRPs behind it (diagnostics).
 */
struct ValidationResult {
    Validity state{Validity::NotFound};
    VrpList  matched;    ///< Covering VRPs that authorise the route
    VrpList  unmatched;  ///< Covering VRPs that do not
};

/**
 * @brief Classify a route.
 * @param table Snapshot to validate against.
 * @param route Announced prefix (its length is the route length).
 * @param origin_as Origin AS of the route.
 */
ValidationResult validate(const VrpTable& table, const net::IpPrefix& route, std::uint32_t origin_as);

/// Same verdict without collecting diagnostics (no allocation).
Validity validity(const VrpTable& table, const net::IpPrefix& route, std::uint32_t origin_as) noexcept;

} // namespace rpkiv::vrp

/**
 * @file vrp.hpp
 * @brief Validated ROA Payload: (prefix, max-length, origin AS).
 *
 * A VRP is a plain value. Several VRPs may share a prefix with different
 * origins or max-lengths; identity is the full triple.
 */
#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <vector>

#include "rpkiv/net/ip_prefix.hpp"

namespace rpkiv::vrp {

struct Vrp final {
    /// Announced network.
    net::IpPrefix prefix;

    /// Longest route length this VRP authorises (>= prefix.length).
    std::uint8_t max_length{0};

    /// Authorised origin AS. AS0 authorises nothing.
    std::uint32_t asn{0};

    /// True when max_length is within [prefix.length, family width].
    bool well_formed() const noexcept {
        return max_length >= prefix.length && max_length <= prefix.width();
    }

    std::string to_string() const {
        return prefix.to_string() + "-" + std::to_string(max_length) + " AS" + std::to_string(asn);
    }

    bool operator==(const Vrp&) const = default;
    auto operator<=>(const Vrp&) const = default;
};

using VrpList = std::vector<Vrp>;

} // namespace rpkiv::vrp

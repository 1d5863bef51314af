/**
 * @file ip_prefix.hpp
 * @brief IPv4/IPv6 network prefix shared by the codec, the VRP tables and validation.
 *
 * Addresses are stored as 16 network-order bytes regardless of family so that
 * tries and comparisons use one code path. The host part is always zero.
 */
#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "rpkiv/compat/expected.hpp"

namespace rpkiv::net {

/// Address family of a prefix.
enum class Family : std::uint8_t { V4 = 4, V6 = 6 };

/// Address width in bits for a family (32 or 128).
constexpr std::uint8_t width_of(Family f) noexcept { return f == Family::V4 ? 32 : 128; }

/// Reasons a textual prefix is rejected.
enum class PrefixError : std::uint8_t {
    BadAddress,   ///< inet_pton rejected the address part
    BadLength,    ///< Length part is not a decimal number
    LengthRange   ///< Length exceeds the family width
};

/**
 * @brief Canonical network prefix (address with host bits cleared + length).
 */
struct IpPrefix final {
    Family family{Family::V4};
    std::array<std::uint8_t, 16> addr{};  ///< Network-order bytes; only the first 4 are used for V4
    std::uint8_t length{0};

    /// Build from raw network-order bytes; bits past @p len are cleared.
    static IpPrefix from_bytes(Family f, const std::uint8_t* bytes, std::uint8_t len) noexcept;

    /// Build from a host-order IPv4 address.
    static IpPrefix v4(std::uint32_t host_order, std::uint8_t len) noexcept;

    /// Parse "a.b.c.d/len", "x::/len" or a bare address (host prefix).
    static rpkiv_detail::expected<IpPrefix, PrefixError> parse(std::string_view text);

    /// Bit @p i of the address, counted from the most significant bit.
    bool bit(std::uint8_t i) const noexcept {
        return (addr[i >> 3] >> (7 - (i & 7))) & 1u;
    }

    std::uint8_t width() const noexcept { return width_of(family); }

    /// True if this prefix is a supernet of (or equal to) @p other.
    bool covers(const IpPrefix& other) const noexcept;

    /// Same address truncated to @p len bits.
    IpPrefix truncated(std::uint8_t len) const noexcept;

    std::string to_string() const;

    bool operator==(const IpPrefix&) const = default;
    auto operator<=>(const IpPrefix&) const = default;
};

/// Parse a decimal origin AS ("64500" or "AS64500"); nullopt unless it fits 32 bits.
std::optional<std::uint32_t> parse_asn(std::string_view text) noexcept;

/// Parse a decimal TCP port in 1..65535.
std::optional<std::uint16_t> parse_port(std::string_view text) noexcept;

} // namespace rpkiv::net

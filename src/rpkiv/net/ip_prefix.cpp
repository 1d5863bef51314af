/**
 * @file ip_prefix.cpp
 * @brief Parsing, formatting and containment for IpPrefix.
 */
#include "rpkiv/net/ip_prefix.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>
#include <cstring>
#include <arpa/inet.h>

namespace rpkiv::net {

namespace {

void clear_host_bits(std::array<std::uint8_t, 16>& a, std::uint8_t len) noexcept {
    const std::size_t full = len / 8;
    const std::uint8_t rem = len % 8;
    if (full < a.size()) {
        if (rem) {
            a[full] &= static_cast<std::uint8_t>(0xFFu << (8 - rem));
            std::fill(a.begin() + static_cast<std::ptrdiff_t>(full) + 1, a.end(), 0);
        } else {
            std::fill(a.begin() + static_cast<std::ptrdiff_t>(full), a.end(), 0);
        }
    }
}

} // namespace

IpPrefix IpPrefix::from_bytes(Family f, const std::uint8_t* bytes, std::uint8_t len) noexcept {
    IpPrefix p;
    p.family = f;
    p.length = std::min(len, width_of(f));
    std::memcpy(p.addr.data(), bytes, f == Family::V4 ? 4 : 16);
    clear_host_bits(p.addr, p.length);
    return p;
}

IpPrefix IpPrefix::v4(std::uint32_t host_order, std::uint8_t len) noexcept {
    const std::uint8_t b[4] = {
        static_cast<std::uint8_t>(host_order >> 24), static_cast<std::uint8_t>(host_order >> 16),
        static_cast<std::uint8_t>(host_order >> 8),  static_cast<std::uint8_t>(host_order)};
    return from_bytes(Family::V4, b, len);
}

rpkiv_detail::expected<IpPrefix, PrefixError> IpPrefix::parse(std::string_view text) {
    const auto slash = text.find('/');
    const std::string host(text.substr(0, slash));

    unsigned char buf[sizeof(struct in6_addr)]{};
    Family fam;
    if (inet_pton(AF_INET, host.c_str(), buf) == 1)       fam = Family::V4;
    else if (inet_pton(AF_INET6, host.c_str(), buf) == 1) fam = Family::V6;
    else return rpkiv_detail::unexpected(PrefixError::BadAddress);

    unsigned len = width_of(fam);
    if (slash != std::string_view::npos) {
        const auto digits = text.substr(slash + 1);
        if (digits.empty() || digits.size() > 3) return rpkiv_detail::unexpected(PrefixError::BadLength);
        const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), len);
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
            return rpkiv_detail::unexpected(PrefixError::BadLength);
        }
        if (len > width_of(fam)) return rpkiv_detail::unexpected(PrefixError::LengthRange);
    }
    return from_bytes(fam, buf, static_cast<std::uint8_t>(len));
}

bool IpPrefix::covers(const IpPrefix& other) const noexcept {
    if (family != other.family || length > other.length) return false;
    return other.truncated(length).addr == addr;
}

IpPrefix IpPrefix::truncated(std::uint8_t len) const noexcept {
    IpPrefix p = *this;
    p.length = std::min(len, length);
    clear_host_bits(p.addr, p.length);
    return p;
}

std::string IpPrefix::to_string() const {
    char buf[INET6_ADDRSTRLEN]{};
    const int af = family == Family::V4 ? AF_INET : AF_INET6;
    if (!inet_ntop(af, addr.data(), buf, sizeof(buf))) return {};
    return std::string(buf) + "/" + std::to_string(length);
}

namespace {

template <class T>
std::optional<T> parse_decimal(std::string_view text) noexcept {
    T v{};
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, v);
    if (text.empty() || ec != std::errc{} || ptr != end) return std::nullopt;
    return v;
}

} // namespace

std::optional<std::uint32_t> parse_asn(std::string_view text) noexcept {
    if (text.size() > 2 && (text[0] == 'A' || text[0] == 'a') && (text[1] == 'S' || text[1] == 's')) {
        text.remove_prefix(2);
    }
    return parse_decimal<std::uint32_t>(text);
}

std::optional<std::uint16_t> parse_port(std::string_view text) noexcept {
    const auto v = parse_decimal<std::uint16_t>(text);
    if (!v || *v == 0) return std::nullopt;
    return v;
}

} // namespace rpkiv::net

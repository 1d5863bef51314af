/**
 * @file pdu.cpp
 * @brief Strict RTR PDU decoder/encoder and stream framer.
 */
#include "rpkiv/rtr/pdu.hpp"
#include "rpkiv/config/constants.hpp"

#include <algorithm>
#include <type_traits>

namespace rpkiv::rtr {

using rpkiv::config::constants::RTR_HEADER_LEN;
using rpkiv::config::constants::RTR_MAX_PDU_LEN;
using rpkiv::config::constants::RTR_VERSION_MAX;

namespace {

// ---- big-endian helpers ----------------------------------------------------

inline std::uint16_t get16(const std::uint8_t* p) noexcept {
    return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}
inline std::uint32_t get32(const std::uint8_t* p) noexcept {
    return (std::uint32_t(p[0]) << 24) | (std::uint32_t(p[1]) << 16) |
           (std::uint32_t(p[2]) << 8)  |  std::uint32_t(p[3]);
}
inline void put16(std::vector<std::uint8_t>& o, std::uint16_t v) {
    o.push_back(static_cast<std::uint8_t>(v >> 8));
    o.push_back(static_cast<std::uint8_t>(v));
}
inline void put32(std::vector<std::uint8_t>& o, std::uint32_t v) {
    o.push_back(static_cast<std::uint8_t>(v >> 24));
    o.push_back(static_cast<std::uint8_t>(v >> 16));
    o.push_back(static_cast<std::uint8_t>(v >> 8));
    o.push_back(static_cast<std::uint8_t>(v));
}
inline void set32(std::vector<std::uint8_t>& o, std::size_t at, std::uint32_t v) noexcept {
    o[at]     = static_cast<std::uint8_t>(v >> 24);
    o[at + 1] = static_cast<std::uint8_t>(v >> 16);
    o[at + 2] = static_cast<std::uint8_t>(v >> 8);
    o[at + 3] = static_cast<std::uint8_t>(v);
}

inline rpkiv_detail::unexpected<MalformedPdu>
malformed(MalformedPdu::Kind k, const char* field, ErrorCode report = ErrorCode::CorruptData) {
    return rpkiv_detail::unexpected(MalformedPdu{k, field, report});
}

constexpr std::size_t kSerialLen    = 12;
constexpr std::size_t kIpv4Len      = 20;
constexpr std::size_t kIpv6Len      = 32;
constexpr std::size_t kEodV0Len     = 12;
constexpr std::size_t kEodV1Len     = 24;
constexpr std::size_t kSkiLen       = 20;
constexpr std::size_t kRouterKeyMin = RTR_HEADER_LEN + kSkiLen + 4;
constexpr std::size_t kErrorMin     = RTR_HEADER_LEN + 8;
constexpr std::size_t kAspaMin      = RTR_HEADER_LEN + 4;

// Header writer; the length is patched once the body is known.
std::size_t open_header(std::vector<std::uint8_t>& o, std::uint8_t version, PduType t, std::uint16_t field) {
    const std::size_t at = o.size();
    o.push_back(version);
    o.push_back(static_cast<std::uint8_t>(t));
    put16(o, field);
    put32(o, 0);
    return at;
}
void finish(std::vector<std::uint8_t>& o, std::size_t at) {
    set32(o, at + 4, static_cast<std::uint32_t>(o.size() - at));
}

rpkiv_detail::expected<Pdu, MalformedPdu>
decode_prefix(const std::uint8_t* p, std::uint32_t len, std::uint8_t version, net::Family fam) {
    const std::size_t want = fam == net::Family::V4 ? kIpv4Len : kIpv6Len;
    if (len != want) return malformed(MalformedPdu::Kind::BadLength, "length");
    if (get16(p + 2) != 0) return malformed(MalformedPdu::Kind::BadField, "zero");
    const std::uint8_t flags = p[8];
    const std::uint8_t plen  = p[9];
    const std::uint8_t mlen  = p[10];
    if (flags & ~0x01u) return malformed(MalformedPdu::Kind::BadField, "flags");
    if (p[11] != 0) return malformed(MalformedPdu::Kind::BadField, "zero");
    const std::uint8_t width = net::width_of(fam);
    if (plen > width) return malformed(MalformedPdu::Kind::BadField, "prefix_length");
    if (mlen > width || mlen < plen) return malformed(MalformedPdu::Kind::BadField, "max_length");

    PrefixPdu out;
    out.version    = version;
    out.announce   = (flags & 0x01u) != 0;
    out.prefix     = net::IpPrefix::from_bytes(fam, p + 12, plen);
    out.max_length = mlen;
    // Host bits must already be clear on the wire.
    const std::size_t abytes = fam == net::Family::V4 ? 4 : 16;
    for (std::size_t i = 0; i < abytes; ++i) {
        if (out.prefix.addr[i] != p[12 + i]) return malformed(MalformedPdu::Kind::BadField, "prefix");
    }
    out.asn = get32(p + 12 + abytes);
    return out;
}

} // namespace

const char* to_string(PduType t) noexcept {
    switch (t) {
        case PduType::SerialNotify:  return "SerialNotify";
        case PduType::SerialQuery:   return "SerialQuery";
        case PduType::ResetQuery:    return "ResetQuery";
        case PduType::CacheResponse: return "CacheResponse";
        case PduType::Ipv4Prefix:    return "Ipv4Prefix";
        case PduType::Ipv6Prefix:    return "Ipv6Prefix";
        case PduType::EndOfData:     return "EndOfData";
        case PduType::CacheReset:    return "CacheReset";
        case PduType::RouterKey:     return "RouterKey";
        case PduType::ErrorReport:   return "ErrorReport";
        case PduType::Aspa:          return "Aspa";
    }
    return "Unknown";
}

const char* to_string(ErrorCode c) noexcept {
    switch (c) {
        case ErrorCode::CorruptData:                return "Corrupt Data";
        case ErrorCode::InternalError:              return "Internal Error";
        case ErrorCode::NoDataAvailable:            return "No Data Available";
        case ErrorCode::InvalidRequest:             return "Invalid Request";
        case ErrorCode::UnsupportedProtocolVersion: return "Unsupported Protocol Version";
        case ErrorCode::UnsupportedPduType:         return "Unsupported PDU Type";
        case ErrorCode::WithdrawalOfUnknownRecord:  return "Withdrawal of Unknown Record";
        case ErrorCode::DuplicateAnnouncement:      return "Duplicate Announcement Received";
        case ErrorCode::UnexpectedProtocolVersion:  return "Unexpected Protocol Version";
    }
    return "Unknown Error";
}

std::uint8_t version_of(const Pdu& pdu) noexcept {
    return std::visit([](const auto& p) { return p.version; }, pdu);
}

PduType type_of(const Pdu& pdu) noexcept {
    return std::visit([](const auto& p) -> PduType {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, SerialNotify>)  return PduType::SerialNotify;
        else if constexpr (std::is_same_v<T, SerialQuery>)   return PduType::SerialQuery;
        else if constexpr (std::is_same_v<T, ResetQuery>)    return PduType::ResetQuery;
        else if constexpr (std::is_same_v<T, CacheResponse>) return PduType::CacheResponse;
        else if constexpr (std::is_same_v<T, PrefixPdu>)
            return p.prefix.family == net::Family::V4 ? PduType::Ipv4Prefix : PduType::Ipv6Prefix;
        else if constexpr (std::is_same_v<T, EndOfData>)     return PduType::EndOfData;
        else if constexpr (std::is_same_v<T, CacheReset>)    return PduType::CacheReset;
        else if constexpr (std::is_same_v<T, RouterKey>)     return PduType::RouterKey;
        else if constexpr (std::is_same_v<T, ErrorReport>)   return PduType::ErrorReport;
        else                                                 return PduType::Aspa;
    }, pdu);
}

// ------------------------------- Decode --------------------------------------

rpkiv_detail::expected<Pdu, MalformedPdu> decode(std::span<const std::uint8_t> bytes) {
    if (bytes.size() < RTR_HEADER_LEN) return malformed(MalformedPdu::Kind::Truncated, "header");
    const std::uint8_t* p = bytes.data();
    const std::uint8_t version = p[0];
    const std::uint8_t type    = p[1];
    const std::uint16_t field  = get16(p + 2);
    const std::uint32_t len    = get32(p + 4);

    if (len < RTR_HEADER_LEN || len > RTR_MAX_PDU_LEN) return malformed(MalformedPdu::Kind::BadLength, "length");
    if (bytes.size() < len) return malformed(MalformedPdu::Kind::Truncated, "length");
    if (version > RTR_VERSION_MAX) {
        return malformed(MalformedPdu::Kind::BadVersion, "version", ErrorCode::UnsupportedProtocolVersion);
    }

    switch (static_cast<PduType>(type)) {
        case PduType::SerialNotify:
        case PduType::SerialQuery: {
            if (len != kSerialLen) return malformed(MalformedPdu::Kind::BadLength, "length");
            if (type == static_cast<std::uint8_t>(PduType::SerialNotify)) {
                return SerialNotify{version, field, get32(p + 8)};
            }
            return SerialQuery{version, field, get32(p + 8)};
        }
        case PduType::ResetQuery:
        case PduType::CacheReset: {
            if (len != RTR_HEADER_LEN) return malformed(MalformedPdu::Kind::BadLength, "length");
            if (field != 0) return malformed(MalformedPdu::Kind::BadField, "zero");
            if (type == static_cast<std::uint8_t>(PduType::ResetQuery)) return ResetQuery{version};
            return CacheReset{version};
        }
        case PduType::CacheResponse:
            if (len != RTR_HEADER_LEN) return malformed(MalformedPdu::Kind::BadLength, "length");
            return CacheResponse{version, field};

        case PduType::Ipv4Prefix: return decode_prefix(p, len, version, net::Family::V4);
        case PduType::Ipv6Prefix: return decode_prefix(p, len, version, net::Family::V6);

        case PduType::EndOfData: {
            const std::size_t want = version == 0 ? kEodV0Len : kEodV1Len;
            if (len != want) return malformed(MalformedPdu::Kind::BadLength, "length");
            EndOfData e{version, field, get32(p + 8), 0, 0, 0};
            if (version >= 1) {
                e.refresh_interval = get32(p + 12);
                e.retry_interval   = get32(p + 16);
                e.expire_interval  = get32(p + 20);
            }
            return e;
        }

        case PduType::RouterKey: {
            if (version < 1) {
                return malformed(MalformedPdu::Kind::BadType, "type", ErrorCode::UnsupportedPduType);
            }
            if (len < kRouterKeyMin) return malformed(MalformedPdu::Kind::BadLength, "length");
            const std::uint8_t flags = p[2];
            if (flags & ~0x01u) return malformed(MalformedPdu::Kind::BadField, "flags");
            if (p[3] != 0) return malformed(MalformedPdu::Kind::BadField, "zero");
            RouterKey k;
            k.version  = version;
            k.announce = (flags & 0x01u) != 0;
            std::copy(p + 8, p + 8 + kSkiLen, k.ski.begin());
            k.asn = get32(p + 8 + kSkiLen);
            k.spki.assign(p + kRouterKeyMin, p + len);
            return k;
        }

        case PduType::ErrorReport: {
            if (len < kErrorMin) return malformed(MalformedPdu::Kind::BadLength, "length");
            const std::uint32_t inner = get32(p + 8);
            if (inner > len - kErrorMin) return malformed(MalformedPdu::Kind::BadField, "encapsulated_length");
            const std::size_t text_at = RTR_HEADER_LEN + 4 + inner;
            const std::uint32_t tlen = get32(p + text_at);
            if (std::size_t(tlen) != len - text_at - 4) {
                return malformed(MalformedPdu::Kind::BadField, "text_length");
            }
            ErrorReport r;
            r.version = version;
            r.code    = field;
            r.erroneous_pdu.assign(p + RTR_HEADER_LEN + 4, p + RTR_HEADER_LEN + 4 + inner);
            r.text.assign(reinterpret_cast<const char*>(p + text_at + 4), tlen);
            return r;
        }

        case PduType::Aspa: {
            if (version < 2) {
                return malformed(MalformedPdu::Kind::BadType, "type", ErrorCode::UnsupportedPduType);
            }
            if (len < kAspaMin || (len - kAspaMin) % 4 != 0) {
                return malformed(MalformedPdu::Kind::BadLength, "length");
            }
            const std::uint8_t flags = p[2];
            if (flags & ~0x01u) return malformed(MalformedPdu::Kind::BadField, "flags");
            if (p[3] != 0) return malformed(MalformedPdu::Kind::BadField, "zero");
            Aspa a;
            a.version      = version;
            a.announce     = (flags & 0x01u) != 0;
            a.customer_asn = get32(p + 8);
            for (std::size_t at = kAspaMin; at < len; at += 4) a.providers.push_back(get32(p + at));
            return a;
        }
    }
    return malformed(MalformedPdu::Kind::BadType, "type", ErrorCode::UnsupportedPduType);
}

// ------------------------------- Encode --------------------------------------

void encode_into(const Pdu& pdu, std::vector<std::uint8_t>& o) {
    std::visit([&o](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, SerialNotify> || std::is_same_v<T, SerialQuery>) {
            const auto t = std::is_same_v<T, SerialNotify> ? PduType::SerialNotify : PduType::SerialQuery;
            const auto at = open_header(o, v.version, t, v.session_id);
            put32(o, v.serial);
            finish(o, at);
        } else if constexpr (std::is_same_v<T, ResetQuery>) {
            finish(o, open_header(o, v.version, PduType::ResetQuery, 0));
        } else if constexpr (std::is_same_v<T, CacheReset>) {
            finish(o, open_header(o, v.version, PduType::CacheReset, 0));
        } else if constexpr (std::is_same_v<T, CacheResponse>) {
            finish(o, open_header(o, v.version, PduType::CacheResponse, v.session_id));
        } else if constexpr (std::is_same_v<T, PrefixPdu>) {
            const bool v4 = v.prefix.family == net::Family::V4;
            const auto at = open_header(o, v.version, v4 ? PduType::Ipv4Prefix : PduType::Ipv6Prefix, 0);
            o.push_back(v.announce ? 1 : 0);
            o.push_back(v.prefix.length);
            o.push_back(v.max_length);
            o.push_back(0);
            o.insert(o.end(), v.prefix.addr.begin(), v.prefix.addr.begin() + (v4 ? 4 : 16));
            put32(o, v.asn);
            finish(o, at);
        } else if constexpr (std::is_same_v<T, EndOfData>) {
            const auto at = open_header(o, v.version, PduType::EndOfData, v.session_id);
            put32(o, v.serial);
            if (v.version >= 1) {
                put32(o, v.refresh_interval);
                put32(o, v.retry_interval);
                put32(o, v.expire_interval);
            }
            finish(o, at);
        } else if constexpr (std::is_same_v<T, RouterKey>) {
            const auto at = open_header(o, v.version, PduType::RouterKey,
                                  static_cast<std::uint16_t>((v.announce ? 1 : 0) << 8));
            o.insert(o.end(), v.ski.begin(), v.ski.end());
            put32(o, v.asn);
            o.insert(o.end(), v.spki.begin(), v.spki.end());
            finish(o, at);
        } else if constexpr (std::is_same_v<T, ErrorReport>) {
            const auto at = open_header(o, v.version, PduType::ErrorReport, v.code);
            put32(o, static_cast<std::uint32_t>(v.erroneous_pdu.size()));
            o.insert(o.end(), v.erroneous_pdu.begin(), v.erroneous_pdu.end());
            put32(o, static_cast<std::uint32_t>(v.text.size()));
            o.insert(o.end(), v.text.begin(), v.text.end());
            finish(o, at);
        } else {
            const auto at = open_header(o, v.version, PduType::Aspa,
                                  static_cast<std::uint16_t>((v.announce ? 1 : 0) << 8));
            put32(o, v.customer_asn);
            for (auto asn : v.providers) put32(o, asn);
            finish(o, at);
        }
    }, pdu);
}

std::vector<std::uint8_t> encode(const Pdu& pdu) {
    std::vector<std::uint8_t> out;
    encode_into(pdu, out);
    return out;
}

// ------------------------------- Framer --------------------------------------

void PduFramer::feed(std::span<const std::uint8_t> bytes) {
    // Compact consumed prefix before growing.
    if (off_ > 0 && off_ == buf_.size()) { buf_.clear(); off_ = 0; }
    else if (off_ > RTR_MAX_PDU_LEN) { buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(off_)); off_ = 0; }
    buf_.insert(buf_.end(), bytes.begin(), bytes.end());
}

std::optional<PduFramer::Frame> PduFramer::next() {
    if (buffered() < RTR_HEADER_LEN) return std::nullopt;
    const std::uint8_t* p = buf_.data() + off_;
    const std::uint32_t len = get32(p + 4);
    if (len < RTR_HEADER_LEN || len > RTR_MAX_PDU_LEN) {
        // The stream cannot be resynchronised past a bad length.
        Frame f{malformed(MalformedPdu::Kind::BadLength, "length"),
                std::vector<std::uint8_t>(p, p + RTR_HEADER_LEN)};
        clear();
        return f;
    }
    if (buffered() < len) return std::nullopt;
    Frame f{decode(std::span<const std::uint8_t>(p, len)), std::vector<std::uint8_t>(p, p + len)};
    off_ += len;
    return f;
}

} // namespace rpkiv::rtr

#pragma once
/**
 * @file pdu.hpp
 * @brief RTR protocol data units (RFC 6810, RFC 8210, 8210bis) and their wire codec.
 * @details Every PDU starts with the 8-byte header
 *          | version (1) | type (1) | session-id / flags / error code (2) | length (4) |
 *          in network byte order. Decoding is strict and never reads past the
 *          declared length; encoding always emits the declared layout.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "rpkiv/compat/expected.hpp"
#include "rpkiv/net/ip_prefix.hpp"

namespace rpkiv::rtr {

/** @enum PduType
 *  @brief Wire type codes.
 */
enum class PduType : std::uint8_t {
    SerialNotify  = 0,
    SerialQuery   = 1,
    ResetQuery    = 2,
    CacheResponse = 3,
    Ipv4Prefix    = 4,
    Ipv6Prefix    = 6,
    EndOfData     = 7,
    CacheReset    = 8,
    RouterKey     = 9,   ///< v1+
    ErrorReport   = 10,
    Aspa          = 11   ///< v2
};

/** @enum ErrorCode
 *  @brief Error Report codes (RFC 8210 §12).
 */
enum class ErrorCode : std::uint16_t {
    CorruptData                = 0,
    InternalError              = 1,
    NoDataAvailable            = 2,
    InvalidRequest             = 3,
    UnsupportedProtocolVersion = 4,
    UnsupportedPduType         = 5,
    WithdrawalOfUnknownRecord  = 6,
    DuplicateAnnouncement      = 7,
    UnexpectedProtocolVersion  = 8
};

const char* to_string(PduType t) noexcept;
const char* to_string(ErrorCode c) noexcept;

struct SerialNotify {
    std::uint8_t  version{0};
    std::uint16_t session_id{0};
    std::uint32_t serial{0};
    bool operator==(const SerialNotify&) const = default;
};

struct SerialQuery {
    std::uint8_t  version{0};
    std::uint16_t session_id{0};
    std::uint32_t serial{0};
    bool operator==(const SerialQuery&) const = default;
};

struct ResetQuery {
    std::uint8_t version{0};
    bool operator==(const ResetQuery&) const = default;
};

struct CacheResponse {
    std::uint8_t  version{0};
    std::uint16_t session_id{0};
    bool operator==(const CacheResponse&) const = default;
};

/// IPv4 or IPv6 Prefix PDU; the wire type follows prefix.family.
struct PrefixPdu {
    std::uint8_t  version{0};
    bool          announce{true};   ///< flags bit 0: 1 = announce, 0 = withdraw
    net::IpPrefix prefix{};
    std::uint8_t  max_length{0};
    std::uint32_t asn{0};
    bool operator==(const PrefixPdu&) const = default;
};

/// End of Data. The three intervals are on the wire only for version >= 1.
struct EndOfData {
    std::uint8_t  version{0};
    std::uint16_t session_id{0};
    std::uint32_t serial{0};
    std::uint32_t refresh_interval{0};
    std::uint32_t retry_interval{0};
    std::uint32_t expire_interval{0};
    bool operator==(const EndOfData&) const = default;
};

struct CacheReset {
    std::uint8_t version{0};
    bool operator==(const CacheReset&) const = default;
};

struct RouterKey {
    std::uint8_t  version{1};
    bool          announce{true};
    std::array<std::uint8_t, 20> ski{};
    std::uint32_t asn{0};
    std::vector<std::uint8_t> spki;
    bool operator==(const RouterKey&) const = default;
};

struct ErrorReport {
    std::uint8_t  version{0};
    std::uint16_t code{0};                 ///< Raw code; unknown values are preserved
    std::vector<std::uint8_t> erroneous_pdu;
    std::string   text;
    bool operator==(const ErrorReport&) const = default;
};

struct Aspa {
    std::uint8_t  version{2};
    bool          announce{true};
    std::uint32_t customer_asn{0};
    std::vector<std::uint32_t> providers;
    bool operator==(const Aspa&) const = default;
};

using Pdu = std::variant<SerialNotify, SerialQuery, ResetQuery, CacheResponse, PrefixPdu,
                         EndOfData, CacheReset, RouterKey, ErrorReport, Aspa>;

std::uint8_t version_of(const Pdu& pdu) noexcept;
PduType      type_of(const Pdu& pdu) noexcept;

/** @struct MalformedPdu
 *  @brief Decode failure naming the offending field and the code to report back.
 */
struct MalformedPdu {
    enum class Kind : std::uint8_t { Truncated, BadLength, BadVersion, BadType, BadField };
    Kind        kind{Kind::BadField};
    const char* field{""};                       ///< Static field name, e.g. "max_length"
    ErrorCode   report{ErrorCode::CorruptData};  ///< Code to put in our Error Report
};

/**
 * @brief Decode exactly one PDU from the front of @p bytes.
 * @return The PDU, or MalformedPdu when the bytes violate the layout. At most
 *         the declared length is consumed; trailing bytes are ignored.
 */
rpkiv_detail::expected<Pdu, MalformedPdu> decode(std::span<const std::uint8_t> bytes);

/// Append the wire form of @p pdu to @p out.
void encode_into(const Pdu& pdu, std::vector<std::uint8_t>& out);

/// Wire form of @p pdu.
std::vector<std::uint8_t> encode(const Pdu& pdu);

/**
 * @class PduFramer
 * @brief Reassembles PDUs from an unframed byte stream.
 */
class PduFramer {
public:
    struct Frame {
        rpkiv_detail::expected<Pdu, MalformedPdu> pdu;
        std::vector<std::uint8_t> raw;  ///< Exact bytes of the frame (for Error Report encapsulation)
    };

    void feed(std::span<const std::uint8_t> bytes);

    /// Next complete frame, or nullopt if more bytes are needed.
    std::optional<Frame> next();

    void clear() noexcept { buf_.clear(); off_ = 0; }
    std::size_t buffered() const noexcept { return buf_.size() - off_; }

private:
    std::vector<std::uint8_t> buf_;
    std::size_t off_{0};
};

} // namespace rpkiv::rtr

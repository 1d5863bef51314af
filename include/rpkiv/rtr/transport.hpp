#pragma once
/**
 * @file transport.hpp
 * @brief Reliable byte-stream seam between a session and its cache.
 * @details RtrSession only talks to these interfaces, so tests drive it with an
 *          in-memory cache and deployments can wrap TCP in SSH or TLS.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

#include "rpkiv/compat/expected.hpp"

namespace rpkiv::rtr {

/** @struct TransportError
 *  @brief Failure of a transport operation.
 */
struct TransportError {
    enum class Kind : std::uint8_t {
        Timeout,    ///< Deadline passed; the stream is still usable for reads
        Closed,     ///< Peer closed the stream
        Refused,    ///< Connect failed
        Io,         ///< Any other socket error
        Cancelled   ///< cancel() was called
    };
    Kind        kind{Kind::Io};
    std::string message;
};

/** @class Transport
 *  @brief Connected byte stream. Used by one thread, except cancel().
 */
class Transport {
public:
    virtual ~Transport() = default;

    /// Read up to buf.size() bytes, waiting at most @p timeout. Never returns 0 bytes on success.
    virtual rpkiv_detail::expected<std::size_t, TransportError>
    read_some(std::span<std::uint8_t> buf, std::chrono::milliseconds timeout) = 0;

    /// Write all of @p bytes within @p timeout.
    virtual rpkiv_detail::expected<void, TransportError>
    write_all(std::span<const std::uint8_t> bytes, std::chrono::milliseconds timeout) = 0;

    virtual void close() noexcept = 0;

    /// Abort any blocking call in progress. Thread-safe.
    virtual void cancel() noexcept = 0;
};

/** @class Connector
 *  @brief Opens transports to one cache.
 */
class Connector {
public:
    virtual ~Connector() = default;

    virtual rpkiv_detail::expected<std::unique_ptr<Transport>, TransportError>
    connect(std::chrono::milliseconds timeout) = 0;

    /// Abort a connect() in progress. Thread-safe.
    virtual void cancel() noexcept = 0;

    /// Human-readable endpoint, for logs.
    virtual std::string describe() const = 0;
};

} // namespace rpkiv::rtr

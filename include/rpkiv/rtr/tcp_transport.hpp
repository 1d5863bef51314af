#pragma once
/**
 * @file tcp_transport.hpp
 * @brief Plain TCP transport (RFC 8210 §9.1) on Boost.Asio.
 * @details Each blocking call runs one async operation on a private io_context
 *          bounded by io_context::run_for; cancel() stops that context from any
 *          thread. Credentials are accepted for config parity and ignored.
 */

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio.hpp>

#include "rpkiv/rtr/session_config.hpp"
#include "rpkiv/rtr/transport.hpp"

namespace rpkiv::rtr {

class TcpTransport final : public Transport {
public:
    TcpTransport(std::unique_ptr<boost::asio::io_context> ioc, boost::asio::ip::tcp::socket sock);
    ~TcpTransport() override;

    rpkiv_detail::expected<std::size_t, TransportError>
    read_some(std::span<std::uint8_t> buf, std::chrono::milliseconds timeout) override;

    rpkiv_detail::expected<void, TransportError>
    write_all(std::span<const std::uint8_t> bytes, std::chrono::milliseconds timeout) override;

    void close() noexcept override;
    void cancel() noexcept override;

private:
    TransportError error_from(const boost::system::error_code& ec) const;

    std::unique_ptr<boost::asio::io_context> ioc_;
    boost::asio::ip::tcp::socket sock_;
    std::atomic<bool> cancelled_{false};
};

class TcpConnector final : public Connector {
public:
    TcpConnector(std::string host, std::uint16_t port, std::optional<Credentials> creds = std::nullopt);

    rpkiv_detail::expected<std::unique_ptr<Transport>, TransportError>
    connect(std::chrono::milliseconds timeout) override;

    void cancel() noexcept override;
    std::string describe() const override;

private:
    std::string   host_;
    std::uint16_t port_;
    std::mutex    mu_;
    boost::asio::io_context* active_{nullptr};  ///< Context of the connect in progress (guarded by mu_)
};

} // namespace rpkiv::rtr

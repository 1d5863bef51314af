/**
 * @file tcp_transport.cpp
 * @brief Boost.Asio implementation of TcpTransport / TcpConnector.
 */
#include "rpkiv/rtr/tcp_transport.hpp"

#include <algorithm>

#include "rpkiv/obs/observability.hpp"

namespace rpkiv::rtr {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using error_code = boost::system::error_code;

namespace {

/// Drive @p ioc until @p done or @p timeout; on expiry abort via @p abort and drain the handler.
template <class Abort>
bool run_bounded(asio::io_context& ioc, const bool& done, std::chrono::milliseconds timeout, Abort&& abort) {
    ioc.restart();
    ioc.run_for(timeout);
    if (done) return true;
    abort();
    // The handler references the caller's stack: wait for it even if stop() races in.
    while (!done) {
        ioc.restart();
        ioc.run_one();
    }
    return false;
}

TransportError::Kind kind_of(const error_code& ec) {
    if (ec == asio::error::eof || ec == asio::error::connection_reset || ec == asio::error::broken_pipe)
        return TransportError::Kind::Closed;
    if (ec == asio::error::connection_refused || ec == asio::error::host_not_found ||
        ec == asio::error::host_unreachable || ec == asio::error::network_unreachable)
        return TransportError::Kind::Refused;
    if (ec == asio::error::operation_aborted) return TransportError::Kind::Cancelled;
    return TransportError::Kind::Io;
}

} // namespace

// ---------------------------------------------------------------------------
// TcpTransport
// ---------------------------------------------------------------------------

TcpTransport::TcpTransport(std::unique_ptr<asio::io_context> ioc, tcp::socket sock)
    : ioc_(std::move(ioc)), sock_(std::move(sock)) {
    error_code ignored;
    sock_.set_option(tcp::no_delay(true), ignored);
}

TcpTransport::~TcpTransport() { close(); }

TransportError TcpTransport::error_from(const error_code& ec) const {
    if (cancelled_.load(std::memory_order_acquire))
        return TransportError{TransportError::Kind::Cancelled, "cancelled"};
    return TransportError{kind_of(ec), ec.message()};
}

rpkiv_detail::expected<std::size_t, TransportError>
TcpTransport::read_some(std::span<std::uint8_t> buf, std::chrono::milliseconds timeout) {
    if (cancelled_.load(std::memory_order_acquire))
        return rpkiv_detail::unexpected(TransportError{TransportError::Kind::Cancelled, "cancelled"});
    bool done = false;
    error_code ec;
    std::size_t n = 0;
    sock_.async_read_some(asio::buffer(buf.data(), buf.size()), [&](const error_code& e, std::size_t k) {
        ec = e;
        n = k;
        done = true;
    });
    if (!run_bounded(*ioc_, done, timeout, [&] { error_code ignored; sock_.cancel(ignored); })) {
        if (cancelled_.load(std::memory_order_acquire))
            return rpkiv_detail::unexpected(TransportError{TransportError::Kind::Cancelled, "cancelled"});
        if (!ec || ec == asio::error::operation_aborted) {
            if (n > 0) return n;
            return rpkiv_detail::unexpected(TransportError{TransportError::Kind::Timeout, "read timeout"});
        }
    }
    if (ec) return rpkiv_detail::unexpected(error_from(ec));
    if (n == 0) return rpkiv_detail::unexpected(TransportError{TransportError::Kind::Closed, "peer closed"});
    return n;
}

rpkiv_detail::expected<void, TransportError>
TcpTransport::write_all(std::span<const std::uint8_t> bytes, std::chrono::milliseconds timeout) {
    if (cancelled_.load(std::memory_order_acquire))
        return rpkiv_detail::unexpected(TransportError{TransportError::Kind::Cancelled, "cancelled"});
    bool done = false;
    error_code ec;
    asio::async_write(sock_, asio::buffer(bytes.data(), bytes.size()), [&](const error_code& e, std::size_t) {
        ec = e;
        done = true;
    });
    if (!run_bounded(*ioc_, done, timeout, [&] { error_code ignored; sock_.cancel(ignored); })) {
        if (cancelled_.load(std::memory_order_acquire))
            return rpkiv_detail::unexpected(TransportError{TransportError::Kind::Cancelled, "cancelled"});
        // A partially written PDU leaves the stream unusable.
        return rpkiv_detail::unexpected(TransportError{TransportError::Kind::Timeout, "write timeout"});
    }
    if (ec) return rpkiv_detail::unexpected(error_from(ec));
    return {};
}

void TcpTransport::close() noexcept {
    error_code ignored;
    sock_.shutdown(tcp::socket::shutdown_both, ignored);
    sock_.close(ignored);
}

void TcpTransport::cancel() noexcept {
    cancelled_.store(true, std::memory_order_release);
    ioc_->stop();
}

// ---------------------------------------------------------------------------
// TcpConnector
// ---------------------------------------------------------------------------

TcpConnector::TcpConnector(std::string host, std::uint16_t port, std::optional<Credentials> creds)
    : host_(std::move(host)), port_(port) {
    if (creds) {
        obs::logger()->warn("cache {}: credentials configured but plain TCP transport ignores them", describe());
    }
}

std::string TcpConnector::describe() const {
    return "tcp://" + host_ + ":" + std::to_string(port_);
}

rpkiv_detail::expected<std::unique_ptr<Transport>, TransportError>
TcpConnector::connect(std::chrono::milliseconds timeout) {
    auto ioc = std::make_unique<asio::io_context>();
    {
        std::lock_guard<std::mutex> lk(mu_);
        active_ = ioc.get();
    }
    struct Unregister {
        TcpConnector* self;
        ~Unregister() {
            std::lock_guard<std::mutex> lk(self->mu_);
            self->active_ = nullptr;
        }
    } unregister{this};

    tcp::resolver resolver(*ioc);
    tcp::socket sock(*ioc);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto remaining = [&] {
        return std::max(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()),
                        std::chrono::milliseconds{0});
    };

    bool done = false;
    error_code ec;
    tcp::resolver::results_type endpoints;
    resolver.async_resolve(host_, std::to_string(port_),
                           [&](const error_code& e, tcp::resolver::results_type r) {
                               ec = e;
                               endpoints = std::move(r);
                               done = true;
                           });
    if (!run_bounded(*ioc, done, remaining(), [&] { resolver.cancel(); }))
        return rpkiv_detail::unexpected(TransportError{TransportError::Kind::Timeout, "resolve timeout " + describe()});
    if (ec)
        return rpkiv_detail::unexpected(TransportError{kind_of(ec), "resolve " + describe() + ": " + ec.message()});

    done = false;
    asio::async_connect(sock, endpoints, [&](const error_code& e, const tcp::endpoint&) {
        ec = e;
        done = true;
    });
    if (!run_bounded(*ioc, done, remaining(), [&] { error_code ignored; sock.close(ignored); }))
        return rpkiv_detail::unexpected(TransportError{TransportError::Kind::Timeout, "connect timeout " + describe()});
    if (ec)
        return rpkiv_detail::unexpected(TransportError{kind_of(ec), "connect " + describe() + ": " + ec.message()});

    obs::logger()->debug("connected to {}", describe());
    return std::unique_ptr<Transport>(std::make_unique<TcpTransport>(std::move(ioc), std::move(sock)));
}

void TcpConnector::cancel() noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    if (active_ != nullptr) active_->stop();
}

} // namespace rpkiv::rtr

#include "mbk/network/tcp_client.hpp"
#include "mbk/network/retry_service.hpp"

#include <spdlog/spdlog.h>

#include <array>

namespace mbk::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

TcpClient::TcpClient()
    : socket_(io_context_) {
}

TcpClient::~TcpClient() {
    close();
}

bool TcpClient::run(std::chrono::milliseconds timeout) {
    io_context_.restart();
    io_context_.run_for(timeout);

    if (!io_context_.stopped()) {
        // Deadline hit: cancel outstanding work and let its handlers finish.
        boost::system::error_code ignored;
        socket_.close(ignored);
        io_context_.run();
        return false;
    }
    return true;
}

template<typename T>
Outcome<T> TcpClient::transport_error(const boost::system::error_code& ec, const char* what) {
    close();
    return Fail<T>(classify(ec), std::string(what) + " " + peer_ + ": " + ec.message());
}

Outcome<void> TcpClient::connect(const std::string& host, std::uint32_t port, std::chrono::milliseconds timeout) {
    close();
    peer_ = host + ":" + std::to_string(port);

    if (port == 0 || port > 65535) {
        return Fail<void>(ErrorCode::Validation, "Port out of range: " + std::to_string(port));
    }

    boost::system::error_code ec;
    tcp::resolver resolver(io_context_);
    const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        return Fail<void>(classify(ec), "Cannot resolve " + peer_ + ": " + ec.message());
    }

    ec = asio::error::would_block;
    asio::async_connect(socket_, endpoints,
        [&ec](const boost::system::error_code& error, const tcp::endpoint&) {
            ec = error;
        });

    if (!run(timeout)) {
        close();
        return Fail<void>(ErrorCode::Timeout, "Connect to " + peer_ + " timed out after " +
                          std::to_string(timeout.count()) + "ms");
    }
    if (ec) {
        return transport_error<void>(ec, "Connect to");
    }

    socket_.set_option(tcp::no_delay(true), ec);
    spdlog::debug("Connected to {}", peer_);
    return Ok();
}

Outcome<void> TcpClient::write_frame(const Frame& frame, std::chrono::milliseconds timeout) {
    if (!is_open()) {
        return Fail<void>(ErrorCode::TransientNetwork, "Not connected to " + peer_);
    }

    auto encoded = encode_frame(frame);
    if (encoded.is_error()) {
        return Err<void>(encoded.error());
    }

    boost::system::error_code ec = asio::error::would_block;
    asio::async_write(socket_, asio::buffer(encoded.value()),
        [&ec](const boost::system::error_code& error, std::size_t) {
            ec = error;
        });

    if (!run(timeout)) {
        close();
        return Fail<void>(ErrorCode::Timeout, "Write to " + peer_ + " timed out");
    }
    if (ec) {
        return transport_error<void>(ec, "Write to");
    }
    return Ok();
}

Outcome<Frame> TcpClient::read_frame(std::chrono::milliseconds timeout) {
    if (!is_open()) {
        return Fail<Frame>(ErrorCode::TransientNetwork, "Not connected to " + peer_);
    }

    std::array<std::uint8_t, kFramePrefixBytes> prefix{};
    boost::system::error_code ec = asio::error::would_block;
    asio::async_read(socket_, asio::buffer(prefix),
        [&ec](const boost::system::error_code& error, std::size_t) {
            ec = error;
        });
    if (!run(timeout)) {
        close();
        return Fail<Frame>(ErrorCode::Timeout, "Read from " + peer_ + " timed out");
    }
    if (ec) {
        return transport_error<Frame>(ec, "Read from");
    }

    auto sizes = decode_prefix(prefix);
    if (sizes.is_error()) {
        close();
        return Err<Frame>(sizes.error());
    }

    std::vector<std::uint8_t> header(sizes.value().header_bytes);
    std::vector<std::uint8_t> payload(sizes.value().payload_bytes);
    std::array<asio::mutable_buffer, 2> body{asio::buffer(header), asio::buffer(payload)};

    ec = asio::error::would_block;
    asio::async_read(socket_, body,
        [&ec](const boost::system::error_code& error, std::size_t) {
            ec = error;
        });
    if (!run(timeout)) {
        close();
        return Fail<Frame>(ErrorCode::Timeout, "Read from " + peer_ + " timed out");
    }
    if (ec) {
        return transport_error<Frame>(ec, "Read from");
    }

    return decode_body(header, std::move(payload));
}

Outcome<Frame> TcpClient::request(const Frame& frame, std::chrono::milliseconds timeout) {
    if (auto sent = write_frame(frame, timeout); sent.is_error()) {
        return Err<Frame>(sent.error());
    }
    return read_frame(timeout);
}

void TcpClient::close() {
    if (socket_.is_open()) {
        boost::system::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
}

} // namespace mbk::network

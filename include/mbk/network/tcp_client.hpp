#pragma once

#include "mbk/core/error.hpp"
#include "mbk/network/wire.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace mbk::network {

/**
 * @brief Blocking frame client with per-operation deadlines
 *
 * Each call drives a private io_context with run_for(); when the deadline
 * passes the socket is closed and the call returns a Timeout error. After a
 * timeout or transport error the client is closed and must reconnect.
 *
 * THREAD SAFETY: not thread-safe, one instance per calling thread
 */
class TcpClient {
public:
    TcpClient();
    ~TcpClient();

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    Outcome<void> connect(const std::string& host, std::uint32_t port, std::chrono::milliseconds timeout);

    /// Sends @p frame and waits for the single reply frame.
    Outcome<Frame> request(const Frame& frame, std::chrono::milliseconds timeout);

    Outcome<void> write_frame(const Frame& frame, std::chrono::milliseconds timeout);
    Outcome<Frame> read_frame(std::chrono::milliseconds timeout);

    void close();
    [[nodiscard]] bool is_open() const { return socket_.is_open(); }

private:
    /// Runs queued work until it finishes or @p timeout passes. Returns false on timeout.
    bool run(std::chrono::milliseconds timeout);

    template<typename T>
    Outcome<T> transport_error(const boost::system::error_code& ec, const char* what);

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::socket socket_;
    std::string peer_;
};

} // namespace mbk::network

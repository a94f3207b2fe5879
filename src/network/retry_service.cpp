#include "mbk/network/retry_service.hpp"

#include <boost/asio.hpp>

#include <algorithm>
#include <random>

namespace mbk::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

ErrorCode classify(const boost::system::error_code& ec) noexcept {
    namespace error = asio::error;
    if (ec == error::timed_out) {
        return ErrorCode::Timeout;
    }
    if (ec == error::connection_refused || ec == error::connection_reset ||
        ec == error::connection_aborted || ec == error::network_unreachable ||
        ec == error::host_unreachable || ec == error::network_down ||
        ec == error::try_again || ec == error::broken_pipe ||
        ec == error::eof || ec == error::host_not_found_try_again ||
        ec == error::network_reset || ec == error::shut_down) {
        return ErrorCode::TransientNetwork;
    }
    if (ec == error::operation_aborted) {
        return ErrorCode::Cancelled;
    }
    if (ec == error::host_not_found || ec == error::invalid_argument) {
        return ErrorCode::Validation;
    }
    return ErrorCode::Io;
}

NetworkRetryService::NetworkRetryService(RetryPolicy policy, RetrySleeper sleeper)
    : policy_(std::move(policy)),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay, const core::CancellationToken& cancel) {
            return cancel.wait_for(delay);
        };
    }
}

std::chrono::milliseconds NetworkRetryService::delay_for_attempt(std::uint32_t attempt) const {
    const auto exponent = std::min<std::uint32_t>(attempt == 0 ? 0 : attempt - 1, 30);
    const double scaled = static_cast<double>(policy_.base_delay.count()) * static_cast<double>(1ULL << exponent);
    const double capped = std::min(scaled, static_cast<double>(policy_.max_delay.count()));
    auto delay = std::chrono::milliseconds(static_cast<std::int64_t>(capped));

    if (policy_.enable_jitter && delay.count() > 0) {
        thread_local std::mt19937_64 engine{std::random_device{}()};
        std::uniform_int_distribution<std::int64_t> jitter(0, delay.count() / 10);
        delay += std::chrono::milliseconds(jitter(engine));
    }
    return delay;
}

bool NetworkRetryService::is_retriable(const Error& error) const {
    if (error.code == ErrorCode::Cancelled || error.code == ErrorCode::RetryExhausted) {
        return false;
    }
    return policy_.retriable.count(error.code) > 0;
}

std::uint32_t NetworkRetryService::max_attempts() const noexcept {
    return std::clamp<std::uint32_t>(policy_.max_attempts, 1, 20);
}

bool NetworkRetryService::sleep(std::chrono::milliseconds delay, const core::CancellationToken& cancel) const {
    return sleeper_(delay, cancel) && !cancel.is_cancelled();
}

Error NetworkRetryService::exhausted(const Error& last, const std::string& operation_name, std::uint32_t attempts) {
    Error error(ErrorCode::RetryExhausted,
                operation_name + " failed after " + std::to_string(attempts) + " attempts: " + last.message);
    error.operation = operation_name;
    error.attempts = attempts;
    return error;
}

NetworkConnectivityResult NetworkRetryService::test_connectivity(const std::string& host,
                                                                 std::uint32_t port,
                                                                 std::chrono::milliseconds timeout) const {
    NetworkConnectivityResult result;
    result.host = host;
    result.port = port;

    if (port == 0 || port > 65535) {
        result.error_message = "Port out of range";
        return result;
    }

    asio::io_context io_context;
    tcp::resolver resolver(io_context);
    boost::system::error_code ec;
    const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        result.error_message = "Resolve failed: " + ec.message();
        return result;
    }

    tcp::socket socket(io_context);
    boost::system::error_code connect_ec = asio::error::would_block;
    const auto started = std::chrono::steady_clock::now();
    asio::async_connect(socket, endpoints,
        [&connect_ec](const boost::system::error_code& error, const tcp::endpoint&) {
            connect_ec = error;
        });

    io_context.run_for(timeout);
    if (!io_context.stopped()) {
        boost::system::error_code ignored;
        socket.close(ignored);
        io_context.run();
        result.error_message = "Connection timed out after " + std::to_string(timeout.count()) + "ms";
        return result;
    }

    result.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (connect_ec) {
        result.error_message = connect_ec.message();
        return result;
    }

    result.reachable = true;
    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
    return result;
}

bool NetworkRetryService::wait_for_connectivity(const std::string& host,
                                                std::uint32_t port,
                                                std::chrono::milliseconds max_wait,
                                                const core::CancellationToken& cancel,
                                                std::chrono::milliseconds poll_interval) const {
    const auto deadline = std::chrono::steady_clock::now() + max_wait;
    for (;;) {
        if (cancel.is_cancelled()) {
            return false;
        }
        const auto probe = test_connectivity(host, port, std::min(poll_interval, max_wait));
        if (probe.reachable) {
            return true;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            spdlog::warn("{}:{} still unreachable after {}ms: {}", host, port, max_wait.count(), probe.error_message);
            return false;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (!sleeper_(std::min(poll_interval, remaining), cancel)) {
            return false;
        }
    }
}

} // namespace mbk::network

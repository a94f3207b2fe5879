#pragma once

#include "mbk/core/cancellation.hpp"
#include "mbk/core/error.hpp"

#include <boost/system/error_code.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <set>
#include <string>

namespace mbk::network {

struct RetryPolicy {
    std::uint32_t max_attempts = 5;                         ///< Clamped to [1, 20]
    std::chrono::milliseconds base_delay{2000};
    std::chrono::milliseconds max_delay{120000};
    bool enable_jitter = true;                              ///< Adds up to 10% of the delay
    std::set<ErrorCode> retriable{ErrorCode::TransientNetwork, ErrorCode::Timeout};
};

struct NetworkConnectivityResult {
    std::string host;
    std::uint32_t port = 0;
    bool reachable = false;
    std::chrono::milliseconds response_time{0};
    std::string error_message;
};

/**
 * @brief Sleeps between attempts; returns false if cancelled while waiting
 */
using RetrySleeper = std::function<bool(std::chrono::milliseconds, const core::CancellationToken&)>;

/// Maps Boost.System failures onto the shared taxonomy.
[[nodiscard]] ErrorCode classify(const boost::system::error_code& ec) noexcept;

/**
 * @brief Retry-with-backoff wrapper shared by every network call
 *
 * Only failures whose code is in RetryPolicy::retriable are retried; any
 * other failure is returned on the attempt that produced it. Backoff is
 * min(max_delay, base_delay * 2^(attempt-1)) plus optional jitter.
 */
class NetworkRetryService {
public:
    explicit NetworkRetryService(RetryPolicy policy = {}, RetrySleeper sleeper = {});

    template<typename T>
    Outcome<T> execute_with_retry(const std::function<Outcome<T>()>& operation,
                                  const std::string& operation_name,
                                  const std::string& operation_id,
                                  const core::CancellationToken& cancel = {}) const {
        const auto started = std::chrono::steady_clock::now();
        const auto attempts = max_attempts();

        for (std::uint32_t attempt = 1;; ++attempt) {
            if (cancel.is_cancelled()) {
                return Fail<T>(ErrorCode::Cancelled, operation_name + " cancelled");
            }

            auto result = operation();
            if (result.is_ok()) {
                if (attempt > 1) {
                    spdlog::info("{} [{}] succeeded on attempt {}", operation_name, operation_id, attempt);
                }
                return result;
            }

            const auto& error = result.error();
            if (!is_retriable(error)) {
                return result;
            }

            if (attempt >= attempts) {
                const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started);
                spdlog::error("{} [{}] failed after {} attempts in {}ms: {}",
                              operation_name, operation_id, attempt, elapsed.count(), error.message);
                return Err<T>(exhausted(error, operation_name, attempt));
            }

            const auto delay = delay_for_attempt(attempt);
            spdlog::warn("{} [{}] attempt {}/{} failed ({}), retrying in {}ms",
                         operation_name, operation_id, attempt, attempts, error.message, delay.count());
            if (!sleep(delay, cancel)) {
                return Fail<T>(ErrorCode::Cancelled, operation_name + " cancelled during backoff");
            }
        }
    }

    /// Delay before attempt + 1, jitter included when enabled.
    [[nodiscard]] std::chrono::milliseconds delay_for_attempt(std::uint32_t attempt) const;
    [[nodiscard]] bool is_retriable(const Error& error) const;
    [[nodiscard]] std::uint32_t max_attempts() const noexcept;
    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

    /// TCP connect probe; never fails, the outcome is in the result.
    [[nodiscard]] NetworkConnectivityResult test_connectivity(const std::string& host,
                                                              std::uint32_t port,
                                                              std::chrono::milliseconds timeout = std::chrono::seconds(10)) const;

    /// Polls test_connectivity until reachable, max_wait elapses, or cancel fires.
    [[nodiscard]] bool wait_for_connectivity(const std::string& host,
                                             std::uint32_t port,
                                             std::chrono::milliseconds max_wait,
                                             const core::CancellationToken& cancel = {},
                                             std::chrono::milliseconds poll_interval = std::chrono::seconds(5)) const;

private:
    bool sleep(std::chrono::milliseconds delay, const core::CancellationToken& cancel) const;
    static Error exhausted(const Error& last, const std::string& operation_name, std::uint32_t attempts);

    RetryPolicy policy_;
    RetrySleeper sleeper_;
};

} // namespace mbk::network

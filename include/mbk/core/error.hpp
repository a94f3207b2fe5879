#pragma once

#include "mbk/core/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace mbk {

/**
 * @brief Failure categories shared by every module
 *
 * Retry decisions and orchestrator failure handling key off the code,
 * never off the message text.
 */
enum class ErrorCode {
    Validation,
    TransientNetwork,
    ChecksumMismatch,
    Timeout,
    MySqlService,
    IncompleteTransfer,
    UnknownTransfer,
    RetryExhausted,
    Cancelled,
    Io,
    Protocol,
    Unauthorized,
    InsufficientStorage,
    NotFound
};

struct Error {
    ErrorCode code = ErrorCode::Io;
    std::string message;
    std::string operation;       ///< Set by the retry service when attempts are exhausted
    std::uint32_t attempts = 0;  ///< Attempts consumed before giving up

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

template<typename T>
using Outcome = Result<T, Error>;

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;
[[nodiscard]] ErrorCode error_code_from_string(std::string_view name) noexcept;

/// "Validation: target port out of range"
[[nodiscard]] std::string describe(const Error& error);

template<typename T>
Outcome<T> Fail(ErrorCode code, std::string message) {
    return Err<T>(Error(code, std::move(message)));
}

} // namespace mbk

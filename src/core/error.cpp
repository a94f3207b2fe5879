#include "mbk/core/error.hpp"

#include <array>
#include <utility>

namespace mbk {
namespace {

constexpr std::array<std::pair<ErrorCode, std::string_view>, 14> kNames {{
    {ErrorCode::Validation, "Validation"},
    {ErrorCode::TransientNetwork, "TransientNetwork"},
    {ErrorCode::ChecksumMismatch, "ChecksumMismatch"},
    {ErrorCode::Timeout, "Timeout"},
    {ErrorCode::MySqlService, "MySqlService"},
    {ErrorCode::IncompleteTransfer, "IncompleteTransfer"},
    {ErrorCode::UnknownTransfer, "UnknownTransfer"},
    {ErrorCode::RetryExhausted, "RetryExhausted"},
    {ErrorCode::Cancelled, "Cancelled"},
    {ErrorCode::Io, "Io"},
    {ErrorCode::Protocol, "Protocol"},
    {ErrorCode::Unauthorized, "Unauthorized"},
    {ErrorCode::InsufficientStorage, "InsufficientStorage"},
    {ErrorCode::NotFound, "NotFound"},
}};

} // namespace

std::string_view to_string(ErrorCode code) noexcept {
    for (const auto& [value, name] : kNames) {
        if (value == code) {
            return name;
        }
    }
    return "Io";
}

ErrorCode error_code_from_string(std::string_view name) noexcept {
    for (const auto& [value, text] : kNames) {
        if (text == name) {
            return value;
        }
    }
    return ErrorCode::Protocol;
}

std::string describe(const Error& error) {
    std::string text(to_string(error.code));
    text += ": ";
    text += error.message;
    return text;
}

} // namespace mbk

#pragma once

#include "mbk/core/error.hpp"
#include "mbk/transfer/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace mbk::transfer {

// nlohmann ADL hooks; time points are stored as unix milliseconds.
void to_json(nlohmann::json& j, const FileMetadata& metadata);
void from_json(const nlohmann::json& j, FileMetadata& metadata);

void to_json(nlohmann::json& j, const ResumeToken& token);
void from_json(const nlohmann::json& j, ResumeToken& token);

[[nodiscard]] std::int64_t to_unix_millis(std::chrono::system_clock::time_point tp) noexcept;
[[nodiscard]] std::chrono::system_clock::time_point from_unix_millis(std::int64_t millis) noexcept;

/// Parses a token document; malformed input is a Protocol error, never an exception.
[[nodiscard]] Outcome<ResumeToken> parse_resume_token(const std::string& text);

} // namespace mbk::transfer

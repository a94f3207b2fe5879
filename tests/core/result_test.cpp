#include "mbk/core/error.hpp"
#include "mbk/core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using mbk::ErrorCode;

namespace {

mbk::Outcome<int> parse_port(const std::string& text) {
    if (text.empty()) {
        return mbk::Fail<int>(ErrorCode::Validation, "empty port");
    }
    return mbk::Ok(std::stoi(text));
}

} // namespace

TEST(ResultTest, CarriesValue) {
    auto result = parse_port("9400");
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.value(), 9400);
}

TEST(ResultTest, CarriesError) {
    auto result = parse_port("");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Validation);
    EXPECT_EQ(result.error().message, "empty port");
    EXPECT_EQ(result.value_or(1), 1);
}

TEST(ResultTest, VoidResult) {
    mbk::Outcome<void> ok = mbk::Ok();
    EXPECT_TRUE(ok.is_ok());

    auto failed = mbk::Fail<void>(ErrorCode::Io, "disk full");
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(mbk::describe(failed.error()), "Io: disk full");
}

TEST(ErrorCodeTest, NamesRoundTripThroughWireSpelling) {
    for (auto code : {ErrorCode::Validation, ErrorCode::TransientNetwork, ErrorCode::ChecksumMismatch,
                      ErrorCode::Timeout, ErrorCode::MySqlService, ErrorCode::IncompleteTransfer,
                      ErrorCode::UnknownTransfer, ErrorCode::RetryExhausted, ErrorCode::Cancelled,
                      ErrorCode::Io, ErrorCode::Protocol, ErrorCode::Unauthorized,
                      ErrorCode::InsufficientStorage, ErrorCode::NotFound}) {
        EXPECT_EQ(mbk::error_code_from_string(mbk::to_string(code)), code);
    }
    EXPECT_EQ(mbk::to_string(ErrorCode::InsufficientStorage), "InsufficientStorage");
    EXPECT_EQ(mbk::error_code_from_string("NoSuchCode"), ErrorCode::Protocol);
}

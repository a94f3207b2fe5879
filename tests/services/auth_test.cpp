#include "mbk/services/auth.hpp"

#include <gtest/gtest.h>

using mbk::ErrorCode;
using mbk::services::ClientCredentials;
using mbk::services::StaticCredentialAuthenticator;
using mbk::services::decode_auth_token;
using mbk::services::encode_auth_token;
using mbk::services::kUploadBackupPermission;

namespace {

StaticCredentialAuthenticator make_authenticator() {
    ClientCredentials uploader{"db01", "s3cret", {kUploadBackupPermission}};
    ClientCredentials reader{"auditor", "look", {"list_backups"}};
    return StaticCredentialAuthenticator({uploader, reader});
}

} // namespace

TEST(AuthTokenTest, EncodesAsBase64OfIdAndSecret) {
    EXPECT_EQ(encode_auth_token("user", "pass"), "dXNlcjpwYXNz");

    auto decoded = decode_auth_token("dXNlcjpwYXNz");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->first, "user");
    EXPECT_EQ(decoded->second, "pass");
}

TEST(AuthTokenTest, SecretMayContainColons) {
    auto decoded = decode_auth_token(encode_auth_token("db01", "a:b:c"));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->first, "db01");
    EXPECT_EQ(decoded->second, "a:b:c");
}

TEST(AuthTokenTest, RejectsMalformedTokens) {
    EXPECT_FALSE(decode_auth_token("").has_value());
    EXPECT_FALSE(decode_auth_token("not base64!").has_value());
    EXPECT_FALSE(decode_auth_token(encode_auth_token("", "x").substr(0, 3)).has_value());
}

TEST(StaticCredentialAuthenticatorTest, AcceptsKnownClient) {
    auto auth = make_authenticator();
    EXPECT_EQ(auth.client_count(), 2u);

    auto context = auth.authenticate("db01", encode_auth_token("db01", "s3cret"));
    ASSERT_TRUE(context.is_ok());
    EXPECT_EQ(context.value().client_id, "db01");
    EXPECT_TRUE(auth.is_authorized(context.value(), kUploadBackupPermission));
}

TEST(StaticCredentialAuthenticatorTest, RejectsWrongSecretAndUnknownClient) {
    auto auth = make_authenticator();

    auto wrong_secret = auth.authenticate("db01", encode_auth_token("db01", "guess"));
    ASSERT_TRUE(wrong_secret.is_error());
    EXPECT_EQ(wrong_secret.error().code, ErrorCode::Unauthorized);

    auto unknown = auth.authenticate("db99", encode_auth_token("db99", "s3cret"));
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().code, ErrorCode::Unauthorized);

    auto mismatched = auth.authenticate("auditor", encode_auth_token("db01", "s3cret"));
    ASSERT_TRUE(mismatched.is_error());
    EXPECT_EQ(mismatched.error().code, ErrorCode::Unauthorized);
}

TEST(StaticCredentialAuthenticatorTest, UploadNeedsPermission) {
    auto auth = make_authenticator();

    auto context = auth.authenticate("auditor", encode_auth_token("auditor", "look"));
    ASSERT_TRUE(context.is_ok());
    EXPECT_FALSE(auth.is_authorized(context.value(), kUploadBackupPermission));
}

#pragma once

#include "mbk/core/error.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mbk::services {

inline constexpr const char* kUploadBackupPermission = "upload_backup";

struct ClientCredentials {
    std::string client_id;
    std::string secret;
    std::vector<std::string> permissions{kUploadBackupPermission};
};

struct AuthorizationContext {
    std::string client_id;
    std::vector<std::string> permissions;
};

/**
 * @brief Decides who may talk to the receiver and what they may do
 */
class Authenticator {
public:
    virtual ~Authenticator() = default;

    /// Unauthorized when the token is malformed, unknown, or does not match @p client_id.
    virtual Outcome<AuthorizationContext> authenticate(const std::string& client_id,
                                                       const std::string& auth_token) const = 0;

    [[nodiscard]] virtual bool is_authorized(const AuthorizationContext& context,
                                             const std::string& operation) const = 0;
};

/**
 * @brief Fixed client table loaded from the server configuration
 *
 * Tokens are base64("client_id:secret"). Secrets are compared in constant time.
 */
class StaticCredentialAuthenticator : public Authenticator {
public:
    explicit StaticCredentialAuthenticator(std::vector<ClientCredentials> clients);

    Outcome<AuthorizationContext> authenticate(const std::string& client_id,
                                               const std::string& auth_token) const override;

    [[nodiscard]] bool is_authorized(const AuthorizationContext& context,
                                     const std::string& operation) const override;

    [[nodiscard]] std::size_t client_count() const noexcept { return clients_.size(); }

private:
    std::unordered_map<std::string, ClientCredentials> clients_;
};

[[nodiscard]] std::string encode_auth_token(const std::string& client_id, const std::string& secret);

/// Returns {client_id, secret}, or nullopt if the token is not valid base64 of "id:secret".
[[nodiscard]] std::optional<std::pair<std::string, std::string>> decode_auth_token(const std::string& token);

} // namespace mbk::services

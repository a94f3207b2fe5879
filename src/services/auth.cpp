#include "mbk/services/auth.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace mbk::services {

StaticCredentialAuthenticator::StaticCredentialAuthenticator(std::vector<ClientCredentials> clients) {
    for (auto& client : clients) {
        if (client.client_id.empty()) {
            spdlog::warn("Ignoring credential entry with empty client id");
            continue;
        }
        auto id = client.client_id;
        clients_.insert_or_assign(std::move(id), std::move(client));
    }
}

Outcome<AuthorizationContext> StaticCredentialAuthenticator::authenticate(const std::string& client_id,
                                                                          const std::string& auth_token) const {
    const auto decoded = decode_auth_token(auth_token);
    if (!decoded) {
        return Fail<AuthorizationContext>(ErrorCode::Unauthorized, "Malformed authentication token");
    }

    const auto& [token_id, token_secret] = *decoded;
    if (token_id != client_id) {
        return Fail<AuthorizationContext>(ErrorCode::Unauthorized, "Token does not belong to client " + client_id);
    }

    const auto it = clients_.find(client_id);
    if (it == clients_.end()) {
        return Fail<AuthorizationContext>(ErrorCode::Unauthorized, "Unknown client " + client_id);
    }

    const auto& expected = it->second.secret;
    if (expected.size() != token_secret.size() ||
        CRYPTO_memcmp(expected.data(), token_secret.data(), expected.size()) != 0) {
        return Fail<AuthorizationContext>(ErrorCode::Unauthorized, "Invalid credentials for client " + client_id);
    }

    return Ok(AuthorizationContext{client_id, it->second.permissions});
}

bool StaticCredentialAuthenticator::is_authorized(const AuthorizationContext& context,
                                                  const std::string& operation) const {
    return std::find(context.permissions.begin(), context.permissions.end(), operation) != context.permissions.end();
}

std::string encode_auth_token(const std::string& client_id, const std::string& secret) {
    const std::string plain = client_id + ":" + secret;
    std::string encoded(4 * ((plain.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                        reinterpret_cast<const unsigned char*>(plain.data()),
                                        static_cast<int>(plain.size()));
    encoded.resize(static_cast<std::size_t>(std::max(written, 0)));
    return encoded;
}

std::optional<std::pair<std::string, std::string>> decode_auth_token(const std::string& token) {
    if (token.empty() || token.size() % 4 != 0) {
        return std::nullopt;
    }

    std::string decoded(3 * token.size() / 4, '\0');
    const int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(decoded.data()),
                                        reinterpret_cast<const unsigned char*>(token.data()),
                                        static_cast<int>(token.size()));
    if (written < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock keeps the bytes produced by '=' padding.
    std::size_t length = static_cast<std::size_t>(written);
    if (token.size() >= 1 && token[token.size() - 1] == '=') {
        --length;
    }
    if (token.size() >= 2 && token[token.size() - 2] == '=') {
        --length;
    }
    decoded.resize(length);

    const auto colon = decoded.find(':');
    if (colon == std::string::npos || colon == 0) {
        return std::nullopt;
    }
    return std::make_pair(decoded.substr(0, colon), decoded.substr(colon + 1));
}

} // namespace mbk::services

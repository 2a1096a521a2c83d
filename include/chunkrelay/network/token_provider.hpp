#pragma once

#include "http_client.hpp"
#include "../crypto/crypto_types.hpp"
#include "../transfer/transfer_types.hpp"
#include <chrono>
#include <mutex>
#include <stop_token>
#include <string>

namespace chunkrelay::network {

// Supplies bearer tokens. Shared read-only between sessions, so
// implementations must be reentrant.
class TokenProvider {
public:
    virtual ~TokenProvider() = default;

    virtual transfer::TransferResult get_token(std::string& token, std::stop_token stop) = 0;
};

class StaticTokenProvider : public TokenProvider {
public:
    explicit StaticTokenProvider(const std::string& token);

    transfer::TransferResult get_token(std::string& token, std::stop_token stop) override;

private:
    crypto::SecureBytes token_;
};

// OAuth2 client-credentials grant against the Microsoft identity platform.
// A token is reused only while it is valid for at least another refresh_margin.
class ClientSecretTokenProvider : public TokenProvider {
public:
    struct Options {
        std::string authority = "https://login.microsoftonline.com";
        std::string scope = "https://graph.microsoft.com/.default";
        std::chrono::seconds refresh_margin{60};
    };

    ClientSecretTokenProvider(HttpClient& http,
                              std::string tenant_id,
                              std::string client_id,
                              const std::string& client_secret);

    ClientSecretTokenProvider(HttpClient& http,
                              std::string tenant_id,
                              std::string client_id,
                              const std::string& client_secret,
                              Options options);

    transfer::TransferResult get_token(std::string& token, std::stop_token stop) override;

private:
    HttpClient& http_;
    std::string tenant_id_;
    std::string client_id_;
    crypto::SecureBytes client_secret_;
    Options options_;

    std::mutex mutex_;
    crypto::SecureBytes cached_token_;
    std::chrono::steady_clock::time_point expires_at_;

    transfer::TransferResult request_token(std::stop_token stop);
};

} // namespace chunkrelay::network

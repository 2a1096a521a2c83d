#pragma once

#include "../crypto/crypto_types.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace chunkrelay::storage {

// Azure Storage Shared Key authorization, as used by the Blob service.
class AzureSharedKeySigner {
public:
    AzureSharedKeySigner(std::string account, crypto::SecureBytes key);

    // account_key is the base64 text the portal shows; nullopt when it does not decode.
    static std::optional<AzureSharedKeySigner> from_account_key(std::string account,
                                                                const std::string& account_key);

    struct Request {
        std::string method;
        std::string path;                           // URL path, already URI-encoded
        std::map<std::string, std::string> query;   // lowercase names, raw values
        std::map<std::string, std::string> headers; // lowercase names
        uint64_t content_length = 0;
    };

    // Adds x-ms-date and returns the value for the Authorization header.
    std::string sign(Request& request, std::chrono::system_clock::time_point when) const;

    std::string string_to_sign(const Request& request) const;

    // "Fri, 24 May 2013 00:00:00 GMT"
    static std::string ms_date(std::chrono::system_clock::time_point when);

    const std::string& account() const { return account_; }

private:
    std::string account_;
    crypto::SecureBytes key_;
};

} // namespace chunkrelay::storage

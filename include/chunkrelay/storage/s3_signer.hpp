#pragma once

#include "../crypto/crypto_types.hpp"
#include <chrono>
#include <map>
#include <string>

namespace chunkrelay::storage {

struct S3Credentials {
    std::string access_key;
    crypto::SecureBytes secret_key;
    std::string session_token; // empty unless temporary credentials
};

// AWS Signature Version 4 for the "s3" service.
class S3Signer {
public:
    S3Signer(std::string region, S3Credentials credentials);

    struct Request {
        std::string method;
        std::string host;
        std::string path;                          // already URI-encoded
        std::map<std::string, std::string> query;  // raw, encoded when signing
        std::map<std::string, std::string> headers; // lowercase names, signed
        std::string payload_hash;                  // hex SHA-256 of the body
    };

    // Adds x-amz-date, x-amz-content-sha256, the security token when set, and
    // returns the value for the Authorization header.
    std::string sign(Request& request, std::chrono::system_clock::time_point when) const;

    std::string canonical_request(const Request& request) const;

    static std::string encode_query(const std::map<std::string, std::string>& query);
    static std::string amz_date(std::chrono::system_clock::time_point when);

    const std::string& region() const { return region_; }

private:
    std::string region_;
    S3Credentials credentials_;
};

} // namespace chunkrelay::storage

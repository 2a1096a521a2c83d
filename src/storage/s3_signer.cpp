#include "chunkrelay/storage/s3_signer.hpp"
#include "chunkrelay/crypto/hash.hpp"
#include "chunkrelay/core/utils.hpp"
#include <ctime>
#include <span>
#include <vector>

namespace chunkrelay::storage {

using chunkrelay::core::utils::StringUtils;
using chunkrelay::core::utils::UrlUtils;

namespace {

constexpr const char* ALGORITHM = "AWS4-HMAC-SHA256";

crypto::Sha256Hash hmac(std::span<const uint8_t> key, const std::string& message) {
    return crypto::hmac_sha256(key, message);
}

std::span<const uint8_t> view(const crypto::Sha256Hash& hash) {
    return std::span<const uint8_t>(hash.data(), hash.size());
}

}

S3Signer::S3Signer(std::string region, S3Credentials credentials)
    : region_(std::move(region))
    , credentials_(std::move(credentials))
{
}

std::string S3Signer::amz_date(std::chrono::system_clock::time_point when) {
    auto time = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&time, &tm);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
    return buffer;
}

std::string S3Signer::encode_query(const std::map<std::string, std::string>& query) {
    std::vector<std::string> parts;
    for (const auto& [key, value] : query) {
        parts.push_back(UrlUtils::encode(key) + "=" + UrlUtils::encode(value));
    }
    return StringUtils::join(parts, "&");
}

std::string S3Signer::canonical_request(const Request& request) const {
    std::string canonical_headers;
    std::vector<std::string> names;
    for (const auto& [name, value] : request.headers) {
        canonical_headers += name + ":" + StringUtils::trim(value) + "\n";
        names.push_back(name);
    }

    return request.method + "\n" +
           request.path + "\n" +
           encode_query(request.query) + "\n" +
           canonical_headers + "\n" +
           StringUtils::join(names, ";") + "\n" +
           request.payload_hash;
}

std::string S3Signer::sign(Request& request, std::chrono::system_clock::time_point when) const {
    auto timestamp = amz_date(when);
    auto date = timestamp.substr(0, 8);

    request.headers["host"] = request.host;
    request.headers["x-amz-date"] = timestamp;
    request.headers["x-amz-content-sha256"] = request.payload_hash;
    if (!credentials_.session_token.empty()) {
        request.headers["x-amz-security-token"] = credentials_.session_token;
    }

    std::vector<std::string> names;
    for (const auto& [name, value] : request.headers) {
        names.push_back(name);
    }
    auto signed_headers = StringUtils::join(names, ";");

    auto scope = date + "/" + region_ + "/s3/aws4_request";
    auto string_to_sign = std::string(ALGORITHM) + "\n" +
                          timestamp + "\n" +
                          scope + "\n" +
                          crypto::hash_utils::to_hex(crypto::Sha256::hash(canonical_request(request)));

    crypto::SecureBytes secret("AWS4" + credentials_.secret_key.to_string());
    auto date_key = hmac(secret.span(), date);
    auto region_key = hmac(view(date_key), region_);
    auto service_key = hmac(view(region_key), "s3");
    auto signing_key = hmac(view(service_key), "aws4_request");
    auto signature = crypto::hash_utils::to_hex(hmac(view(signing_key), string_to_sign));

    return std::string(ALGORITHM) +
           " Credential=" + credentials_.access_key + "/" + scope +
           ",SignedHeaders=" + signed_headers +
           ",Signature=" + signature;
}

} // namespace chunkrelay::storage

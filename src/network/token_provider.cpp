#include "chunkrelay/network/token_provider.hpp"
#include "chunkrelay/core/logger.hpp"
#include "chunkrelay/core/utils.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <sstream>

namespace chunkrelay::network {

using transfer::TransferResult;
using chunkrelay::core::utils::UrlUtils;

StaticTokenProvider::StaticTokenProvider(const std::string& token)
    : token_(token)
{
}

TransferResult StaticTokenProvider::get_token(std::string& token, std::stop_token) {
    if (token_.empty()) {
        return TransferResult::permanent("No access token configured");
    }
    token = token_.to_string();
    return TransferResult::ok();
}

ClientSecretTokenProvider::ClientSecretTokenProvider(HttpClient& http,
                                                     std::string tenant_id,
                                                     std::string client_id,
                                                     const std::string& client_secret)
    : ClientSecretTokenProvider(http, std::move(tenant_id), std::move(client_id), client_secret, Options{})
{
}

ClientSecretTokenProvider::ClientSecretTokenProvider(HttpClient& http,
                                                     std::string tenant_id,
                                                     std::string client_id,
                                                     const std::string& client_secret,
                                                     Options options)
    : http_(http)
    , tenant_id_(std::move(tenant_id))
    , client_id_(std::move(client_id))
    , client_secret_(client_secret)
    , options_(std::move(options))
{
}

TransferResult ClientSecretTokenProvider::get_token(std::string& token, std::stop_token stop) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    if (cached_token_.empty() || now + options_.refresh_margin >= expires_at_) {
        auto result = request_token(stop);
        if (!result) {
            return result;
        }
    }

    token = cached_token_.to_string();
    return TransferResult::ok();
}

TransferResult ClientSecretTokenProvider::request_token(std::stop_token stop) {
    if (tenant_id_.empty() || client_id_.empty() || client_secret_.empty()) {
        return TransferResult::permanent("Tenant id, client id and client secret are required");
    }

    // The form holds the secret; wipe it once sent.
    crypto::SecureBytes form("grant_type=client_credentials"
                             "&client_id=" + UrlUtils::encode(client_id_) +
                             "&client_secret=" + UrlUtils::encode(client_secret_.to_string()) +
                             "&scope=" + UrlUtils::encode(options_.scope));

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = options_.authority + "/" + UrlUtils::encode(tenant_id_) + "/oauth2/v2.0/token";
    request.add_header("Content-Type", "application/x-www-form-urlencoded");
    request.body = form.span();

    auto response = http_.perform(request, stop);
    auto status = classify_response(response, "Token request");
    if (!status) {
        // A rejected client never recovers by asking again.
        if (response.transport_ok && (response.status == 400 || response.status == 401)) {
            return TransferResult::permanent("Token request rejected: " + response.body_text());
        }
        return status;
    }

    boost::property_tree::ptree json;
    try {
        std::istringstream body(response.body_text());
        boost::property_tree::read_json(body, json);
    } catch (const boost::property_tree::json_parser_error& e) {
        return TransferResult::permanent(std::string("Malformed token response: ") + e.what());
    }

    auto access_token = json.get_optional<std::string>("access_token");
    if (!access_token || access_token->empty()) {
        return TransferResult::permanent("Token response carries no access_token");
    }

    auto expires_in = json.get<long>("expires_in", 3599);
    cached_token_.assign(*access_token);
    expires_at_ = std::chrono::steady_clock::now() + std::chrono::seconds(expires_in);

    LOG_DEBUG("Acquired access token for client {} (expires in {} s)", client_id_, expires_in);
    return TransferResult::ok();
}

} // namespace chunkrelay::network

#include "chunkrelay/storage/azure_signer.hpp"
#include "chunkrelay/crypto/hash.hpp"
#include "chunkrelay/core/utils.hpp"
#include <ctime>

namespace chunkrelay::storage {

using chunkrelay::core::utils::StringUtils;

AzureSharedKeySigner::AzureSharedKeySigner(std::string account, crypto::SecureBytes key)
    : account_(std::move(account))
    , key_(std::move(key))
{
}

std::optional<AzureSharedKeySigner> AzureSharedKeySigner::from_account_key(std::string account,
                                                                           const std::string& account_key) {
    auto key = crypto::hash_utils::secure_from_base64(StringUtils::trim(account_key));
    if (!key) {
        return std::nullopt;
    }
    return AzureSharedKeySigner(std::move(account), std::move(*key));
}

std::string AzureSharedKeySigner::ms_date(std::chrono::system_clock::time_point when) {
    auto time = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&time, &tm);

    char buffer[64];
    std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return buffer;
}

std::string AzureSharedKeySigner::string_to_sign(const Request& request) const {
    auto header = [&request](const char* name) {
        auto it = request.headers.find(name);
        return it == request.headers.end() ? std::string() : StringUtils::trim(it->second);
    };

    // A zero Content-Length is signed as an empty line.
    std::string length = request.content_length > 0 ? std::to_string(request.content_length) : "";

    std::string text = request.method + "\n" +
                       header("content-encoding") + "\n" +
                       header("content-language") + "\n" +
                       length + "\n" +
                       header("content-md5") + "\n" +
                       header("content-type") + "\n" +
                       header("date") + "\n" +
                       header("if-modified-since") + "\n" +
                       header("if-match") + "\n" +
                       header("if-none-match") + "\n" +
                       header("if-unmodified-since") + "\n" +
                       header("range") + "\n";

    for (const auto& [name, value] : request.headers) {
        if (StringUtils::starts_with(name, "x-ms-")) {
            text += name + ":" + StringUtils::trim(value) + "\n";
        }
    }

    text += "/" + account_ + request.path;
    for (const auto& [name, value] : request.query) {
        text += "\n" + name + ":" + value;
    }
    return text;
}

std::string AzureSharedKeySigner::sign(Request& request, std::chrono::system_clock::time_point when) const {
    request.headers["x-ms-date"] = ms_date(when);

    auto signature = crypto::hmac_sha256(key_.span(), string_to_sign(request));
    return "SharedKey " + account_ + ":" +
           crypto::hash_utils::to_base64(std::span<const uint8_t>(signature.data(), signature.size()));
}

} // namespace chunkrelay::storage

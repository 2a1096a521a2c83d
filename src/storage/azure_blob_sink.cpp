#include "chunkrelay/storage/azure_blob_sink.hpp"
#include "chunkrelay/storage/xml_document.hpp"
#include "chunkrelay/crypto/hash.hpp"
#include "chunkrelay/core/logger.hpp"
#include "chunkrelay/core/utils.hpp"
#include <chrono>
#include <cstdio>

namespace chunkrelay::storage {

using transfer::TransferResult;
using network::HttpMethod;
using chunkrelay::core::utils::StringUtils;
using chunkrelay::core::utils::UrlUtils;

namespace {
constexpr const char* API_VERSION = "2020-10-02";
}

AzureBlobSink::AzureBlobSink(network::HttpClient& http,
                             std::string account,
                             std::string container,
                             std::string blob,
                             AzureCredentials credentials,
                             Options options)
    : PartUploadSink(options.part_size)
    , http_(http)
    , account_(std::move(account))
    , container_(std::move(container))
    , blob_(std::move(blob))
    , sas_token_(credentials.sas_token.empty() || credentials.sas_token.front() != '?'
                     ? credentials.sas_token : credentials.sas_token.substr(1))
    , shared_key_(std::move(credentials.shared_key))
    , options_(std::move(options))
{
    if (options_.endpoint.empty()) {
        options_.endpoint = "https://" + account_ + ".blob.core.windows.net";
    }
    while (!options_.endpoint.empty() && options_.endpoint.back() == '/') {
        options_.endpoint.pop_back();
    }

    // Emulators put the account in the endpoint path, and it is signed too.
    auto host_start = options_.endpoint.find("://");
    auto path_start = options_.endpoint.find('/', host_start == std::string::npos ? 0 : host_start + 3);
    path_ = (path_start == std::string::npos) ? "" : options_.endpoint.substr(path_start);
    path_ += "/" + UrlUtils::encode(container_) + "/" + UrlUtils::encode(blob_, true);
}

std::string AzureBlobSink::block_id(uint32_t part_number) {
    // All ids of a blob must have the same length.
    char raw[32];
    std::snprintf(raw, sizeof(raw), "block-%08u", part_number);
    std::string text(raw);
    return crypto::hash_utils::to_base64(network::as_bytes(text));
}

network::HttpResponse AzureBlobSink::send(const std::map<std::string, std::string>& query,
                                          const std::string& content_type,
                                          std::span<const uint8_t> body,
                                          std::stop_token stop) {
    network::HttpRequest request;
    request.method = HttpMethod::PUT;
    request.url = options_.endpoint + path_;

    std::string separator = "?";
    for (const auto& [name, value] : query) {
        request.url += separator + UrlUtils::encode(name) + "=" + UrlUtils::encode(value);
        separator = "&";
    }
    if (!sas_token_.empty()) {
        request.url += separator + sas_token_.to_string();
    }

    if (!content_type.empty()) {
        request.add_header("Content-Type", content_type);
    }

    if (!shared_key_) {
        request.add_header("x-ms-version", API_VERSION);
    } else {
        AzureSharedKeySigner::Request signing;
        signing.method = network::to_string(request.method);
        signing.path = path_;
        signing.query = query;
        signing.headers["x-ms-version"] = API_VERSION;
        if (!content_type.empty()) {
            signing.headers["content-type"] = content_type;
        }
        signing.content_length = body.size();

        auto authorization = shared_key_->sign(signing, std::chrono::system_clock::now());
        for (const auto& [name, value] : signing.headers) {
            if (StringUtils::starts_with(name, "x-ms-")) {
                request.add_header(name, value);
            }
        }
        request.add_header("Authorization", authorization);
    }

    request.body = body;
    return http_.perform(request, stop);
}

TransferResult AzureBlobSink::begin_upload(std::stop_token) {
    block_ids_.clear();
    return TransferResult::ok();
}

TransferResult AzureBlobSink::upload_part(uint32_t part_number,
                                          uint64_t,
                                          std::span<const uint8_t> data,
                                          bool,
                                          std::stop_token stop) {
    // An empty blob is an empty block list.
    if (data.empty()) {
        return TransferResult::ok();
    }

    auto id = block_id(part_number);

    auto response = send({{"comp", "block"}, {"blockid", id}}, "", data, stop);
    auto result = network::classify_response(response, "Put Block " + std::to_string(part_number) +
                                                       " of " + address());
    if (!result) {
        return result;
    }

    block_ids_.resize(part_number);
    block_ids_[part_number - 1] = id;
    return TransferResult::ok();
}

TransferResult AzureBlobSink::complete_upload(std::stop_token stop) {
    XmlWriter writer("BlockList");
    for (const auto& id : block_ids_) {
        if (!id.empty()) {
            writer.add_text("Latest", id);
        }
    }
    auto body = writer.str();

    auto response = send({{"comp", "blocklist"}}, "application/xml", network::as_bytes(body), stop);
    return network::classify_response(response, "Put Block List for " + address());
}

void AzureBlobSink::abort_upload() noexcept {
    LOG_DEBUG("Leaving {} uncommitted block(s) of {} to expire", block_ids_.size(), address());
}

} // namespace chunkrelay::storage

#include "chunkrelay/storage/s3_sink.hpp"
#include "chunkrelay/storage/xml_document.hpp"
#include "chunkrelay/crypto/hash.hpp"
#include "chunkrelay/core/logger.hpp"
#include "chunkrelay/core/utils.hpp"

namespace chunkrelay::storage {

using transfer::TransferResult;
using network::HttpMethod;
using network::HttpResponse;
using chunkrelay::core::utils::StringUtils;
using chunkrelay::core::utils::UrlUtils;

namespace {

// S3 may answer 200 and still report an error in the body.
TransferResult check_error_document(const std::string& body, const std::string& what) {
    auto doc = XmlDocument::parse(body);
    if (!doc) {
        return TransferResult::ok();
    }

    auto code = doc->find("/Error/Code");
    if (!code) {
        return TransferResult::ok();
    }

    auto message = doc->find("/Error/Message").value_or("");
    if (*code == "InternalError" || *code == "SlowDown" || *code == "RequestTimeout") {
        return TransferResult::transient(what + ": " + *code + " " + message);
    }
    return TransferResult::permanent(what + ": " + *code + " " + message);
}

}

S3Sink::S3Sink(network::HttpClient& http,
               std::string bucket,
               std::string key,
               S3Credentials credentials,
               Options options)
    : PartUploadSink(options.part_size)
    , http_(http)
    , bucket_(std::move(bucket))
    , key_(std::move(key))
    , options_(std::move(options))
    , signer_(options_.region, std::move(credentials))
{
    auto encoded_key = UrlUtils::encode(key_, true);

    if (options_.endpoint.empty()) {
        scheme_ = "https";
        host_ = bucket_ + ".s3." + options_.region + ".amazonaws.com";
        path_ = "/" + encoded_key;
    } else {
        auto endpoint = options_.endpoint;
        auto separator = endpoint.find("://");
        scheme_ = separator == std::string::npos ? "https" : endpoint.substr(0, separator);
        host_ = separator == std::string::npos ? endpoint : endpoint.substr(separator + 3);
        while (!host_.empty() && host_.back() == '/') {
            host_.pop_back();
        }
        path_ = "/" + UrlUtils::encode(bucket_) + "/" + encoded_key;
    }

    if (options_.part_size < 5 * 1024 * 1024) {
        LOG_DEBUG("S3 part size {} is below the 5 MiB service minimum", options_.part_size);
    }
}

HttpResponse S3Sink::send(HttpMethod method,
                          const std::map<std::string, std::string>& query,
                          std::span<const uint8_t> body,
                          std::stop_token stop) {
    S3Signer::Request signing;
    signing.method = network::to_string(method);
    signing.host = host_;
    signing.path = path_;
    signing.query = query;
    signing.payload_hash = crypto::hash_utils::to_hex(crypto::Sha256::hash(body));

    auto authorization = signer_.sign(signing, std::chrono::system_clock::now());

    network::HttpRequest request;
    request.method = method;
    request.url = scheme_ + "://" + host_ + path_;
    if (!query.empty()) {
        request.url += "?" + S3Signer::encode_query(query);
    }
    for (const auto& [name, value] : signing.headers) {
        if (name != "host") {
            request.add_header(name, value);
        }
    }
    request.add_header("Authorization", authorization);
    request.body = body;

    return http_.perform(request, stop);
}

TransferResult S3Sink::begin_upload(std::stop_token stop) {
    auto response = send(HttpMethod::POST, {{"uploads", ""}}, {}, stop);
    auto result = network::classify_response(response, "CreateMultipartUpload " + address());
    if (!result) {
        return result;
    }

    auto doc = XmlDocument::parse(response.body_text());
    auto id = doc ? doc->find("/InitiateMultipartUploadResult/UploadId") : std::nullopt;
    if (!id || id->empty()) {
        return TransferResult::transient("CreateMultipartUpload " + address() + ": no UploadId in response");
    }

    upload_id_ = *id;
    etags_.clear();
    LOG_DEBUG("Started multipart upload {} for {}", upload_id_, address());
    return TransferResult::ok();
}

TransferResult S3Sink::upload_part(uint32_t part_number,
                                   uint64_t,
                                   std::span<const uint8_t> data,
                                   bool,
                                   std::stop_token stop) {
    auto response = send(HttpMethod::PUT,
                         {{"partNumber", std::to_string(part_number)}, {"uploadId", upload_id_}},
                         data, stop);
    auto result = network::classify_response(response, "UploadPart " + std::to_string(part_number));
    if (!result) {
        return result;
    }

    auto etag = response.header("etag");
    if (!etag) {
        return TransferResult::transient("UploadPart " + std::to_string(part_number) + ": no ETag");
    }

    etags_.resize(part_number);
    etags_[part_number - 1] = *etag;
    return TransferResult::ok();
}

TransferResult S3Sink::complete_upload(std::stop_token stop) {
    XmlWriter writer("CompleteMultipartUpload");
    for (size_t i = 0; i < etags_.size(); ++i) {
        writer.add_group("Part", {{"PartNumber", std::to_string(i + 1)}, {"ETag", etags_[i]}});
    }
    auto body = writer.str();

    auto response = send(HttpMethod::POST, {{"uploadId", upload_id_}}, network::as_bytes(body), stop);
    std::string what = "CompleteMultipartUpload " + address();
    auto result = network::classify_response(response, what);
    if (!result) {
        return result;
    }

    return check_error_document(response.body_text(), what);
}

void S3Sink::abort_upload() noexcept {
    try {
        // Cleanup runs after cancellation, so it does not share the transfer's stop token.
        auto response = send(HttpMethod::DELETE, {{"uploadId", upload_id_}}, {}, std::stop_token{});
        auto result = network::classify_response(response, "AbortMultipartUpload " + address());
        if (result) {
            LOG_DEBUG("Aborted multipart upload {} for {}", upload_id_, address());
        } else {
            LOG_WARN("Multipart upload {} for {} left behind: {}", upload_id_, address(), result.describe());
        }
    } catch (const std::exception& e) {
        LOG_WARN("Multipart upload {} for {} left behind: {}", upload_id_, address(), e.what());
    }
}

} // namespace chunkrelay::storage

#include "chunkrelay/storage/gcs_sink.hpp"
#include "chunkrelay/core/logger.hpp"
#include "chunkrelay/core/utils.hpp"
#include <algorithm>

namespace chunkrelay::storage {

using transfer::TransferResult;
using network::HttpMethod;
using chunkrelay::core::utils::UrlUtils;

GcsSink::GcsSink(network::HttpClient& http,
                 network::TokenProvider& tokens,
                 std::string bucket,
                 std::string object,
                 Options options)
    : PartUploadSink(round_part_size(options.part_size))
    , http_(http)
    , tokens_(tokens)
    , bucket_(std::move(bucket))
    , object_(std::move(object))
    , options_(std::move(options))
{
}

uint64_t GcsSink::round_part_size(uint64_t size) {
    auto rounded = (size / CHUNK_GRANULARITY) * CHUNK_GRANULARITY;
    return std::max<uint64_t>(rounded, CHUNK_GRANULARITY);
}

TransferResult GcsSink::authorize(network::HttpRequest& request, std::stop_token stop) {
    std::string token;
    auto result = tokens_.get_token(token, stop);
    if (result) {
        request.add_header("Authorization", "Bearer " + token);
    }
    return result;
}

TransferResult GcsSink::begin_upload(std::stop_token stop) {
    network::HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = options_.endpoint + "/upload/storage/v1/b/" + UrlUtils::encode(bucket_) +
                  "/o?uploadType=resumable&name=" + UrlUtils::encode(object_);
    request.add_header("Content-Type", "application/json; charset=UTF-8");

    auto auth = authorize(request, stop);
    if (!auth) {
        return auth;
    }

    auto response = http_.perform(request, stop);
    auto result = network::classify_response(response, "Starting upload to " + address());
    if (!result) {
        return result;
    }

    auto location = response.header("location");
    if (!location || location->empty()) {
        return TransferResult::transient("Starting upload to " + address() + ": no session URI");
    }

    session_url_ = *location;
    finished_ = false;
    LOG_DEBUG("Opened resumable upload session for {}", address());
    return TransferResult::ok();
}

TransferResult GcsSink::upload_part(uint32_t part_number,
                                    uint64_t offset,
                                    std::span<const uint8_t> data,
                                    bool last,
                                    std::stop_token stop) {
    network::HttpRequest request;
    request.method = HttpMethod::PUT;
    request.url = session_url_;
    request.body = data;

    std::string total = last ? std::to_string(offset + data.size()) : "*";
    if (data.empty()) {
        request.add_header("Content-Range", "bytes */" + total);
    } else {
        request.add_header("Content-Range", "bytes " + std::to_string(offset) + "-" +
                                            std::to_string(offset + data.size() - 1) + "/" + total);
    }

    auto auth = authorize(request, stop);
    if (!auth) {
        return auth;
    }

    auto response = http_.perform(request, stop);
    std::string what = "Part " + std::to_string(part_number) + " of " + address();

    // 308 Resume Incomplete acknowledges an intermediate part.
    if (response.transport_ok && response.status == 308) {
        if (last) {
            return TransferResult::transient(what + ": upload not finished after last part");
        }
        return TransferResult::ok();
    }

    auto result = network::classify_response(response, what);
    if (!result) {
        return result;
    }

    if (!last) {
        return TransferResult::permanent(what + ": upload finished before the last part");
    }

    finished_ = true;
    return TransferResult::ok();
}

TransferResult GcsSink::complete_upload(std::stop_token stop) {
    if (finished_) {
        return TransferResult::ok();
    }
    // Every part went out as an intermediate one, so the object size is
    // still open. A size-only range with no body closes the session.
    return upload_part(parts_uploaded() + 1, bytes_accepted(), {}, true, stop);
}

void GcsSink::abort_upload() noexcept {
    try {
        network::HttpRequest request;
        request.method = HttpMethod::DELETE;
        request.url = session_url_;

        auto response = http_.perform(request, std::stop_token{});
        // The service answers 499 to a cancelled session.
        if (response.transport_ok && (response.status == 499 || response.status / 100 == 2)) {
            LOG_DEBUG("Cancelled resumable upload for {}", address());
        } else {
            LOG_WARN("Resumable upload session for {} left to expire (status {})", address(), response.status);
        }
    } catch (const std::exception& e) {
        LOG_WARN("Resumable upload session for {} left to expire: {}", address(), e.what());
    }
}

} // namespace chunkrelay::storage

#pragma once

#include "part_upload_sink.hpp"
#include "s3_signer.hpp"
#include "../network/http_client.hpp"
#include <string>
#include <vector>

namespace chunkrelay::storage {

// Multipart upload to Amazon S3 or an S3-compatible endpoint. Parts other
// than the last must be at least 5 MiB for real S3.
class S3Sink : public PartUploadSink {
public:
    struct Options {
        std::string region = "us-east-1";
        std::string endpoint; // "https://host[:port]"; path-style when set
        uint64_t part_size = 8 * 1024 * 1024;
    };

    S3Sink(network::HttpClient& http,
           std::string bucket,
           std::string key,
           S3Credentials credentials,
           Options options);

    std::string address() const override { return "s3://" + bucket_ + "/" + key_; }

    const std::string& upload_id() const { return upload_id_; }

protected:
    transfer::TransferResult begin_upload(std::stop_token stop) override;
    transfer::TransferResult upload_part(uint32_t part_number,
                                         uint64_t offset,
                                         std::span<const uint8_t> data,
                                         bool last,
                                         std::stop_token stop) override;
    transfer::TransferResult complete_upload(std::stop_token stop) override;
    void abort_upload() noexcept override;

private:
    network::HttpClient& http_;
    std::string bucket_;
    std::string key_;
    Options options_;
    S3Signer signer_;

    std::string scheme_;
    std::string host_;
    std::string path_;

    std::string upload_id_;
    std::vector<std::string> etags_;

    network::HttpResponse send(network::HttpMethod method,
                               const std::map<std::string, std::string>& query,
                               std::span<const uint8_t> body,
                               std::stop_token stop);
};

} // namespace chunkrelay::storage

#pragma once

#include "part_upload_sink.hpp"
#include "../network/http_client.hpp"
#include "../network/token_provider.hpp"
#include <string>

namespace chunkrelay::storage {

// Google Cloud Storage resumable upload. Every part but the last is a
// multiple of 256 KiB, as the service requires.
class GcsSink : public PartUploadSink {
public:
    static constexpr uint64_t CHUNK_GRANULARITY = 256 * 1024;

    struct Options {
        std::string endpoint = "https://storage.googleapis.com";
        uint64_t part_size = 8 * 1024 * 1024;
    };

    GcsSink(network::HttpClient& http,
            network::TokenProvider& tokens,
            std::string bucket,
            std::string object,
            Options options);

    std::string address() const override { return "gs://" + bucket_ + "/" + object_; }

    const std::string& session_url() const { return session_url_; }

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
    network::TokenProvider& tokens_;
    std::string bucket_;
    std::string object_;
    Options options_;

    std::string session_url_;
    bool finished_ = false;

    static uint64_t round_part_size(uint64_t size);
    transfer::TransferResult authorize(network::HttpRequest& request, std::stop_token stop);
};

} // namespace chunkrelay::storage

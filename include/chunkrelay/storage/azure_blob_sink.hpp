#pragma once

#include "azure_signer.hpp"
#include "part_upload_sink.hpp"
#include "../network/http_client.hpp"
#include "../crypto/crypto_types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chunkrelay::storage {

struct AzureCredentials {
    std::string sas_token;                          // with or without the leading '?'
    std::optional<AzureSharedKeySigner> shared_key; // signs every request when set
};

// Azure Blob Storage block blob: Put Block per part, Put Block List to commit.
// Uncommitted blocks are discarded by the service, so abort has nothing to do.
class AzureBlobSink : public PartUploadSink {
public:
    struct Options {
        std::string endpoint; // defaults to https://<account>.blob.core.windows.net
        uint64_t part_size = 8 * 1024 * 1024;
    };

    AzureBlobSink(network::HttpClient& http,
                  std::string account,
                  std::string container,
                  std::string blob,
                  AzureCredentials credentials,
                  Options options);

    std::string address() const override { return "az://" + container_ + "/" + blob_; }

    static std::string block_id(uint32_t part_number);

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
    std::string account_;
    std::string container_;
    std::string blob_;
    crypto::SecureBytes sas_token_;
    std::optional<AzureSharedKeySigner> shared_key_;
    Options options_;
    std::string path_; // URL path of the blob, including any endpoint path

    std::vector<std::string> block_ids_;

    network::HttpResponse send(const std::map<std::string, std::string>& query,
                               const std::string& content_type,
                               std::span<const uint8_t> body,
                               std::stop_token stop);
};

} // namespace chunkrelay::storage

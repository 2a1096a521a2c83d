#pragma once

#include "destination_sink.hpp"
#include "../network/http_client.hpp"
#include "../network/token_provider.hpp"
#include <memory>
#include <optional>
#include <string>

namespace chunkrelay::storage {

struct DestinationAddress {
    enum class Scheme {
        LOCAL,
        S3,
        GCS,
        AZURE,
        MEMORY
    };

    Scheme scheme = Scheme::LOCAL;
    std::string bucket; // bucket or container; empty for LOCAL and MEMORY
    std::string path;   // object key, blob name, file path or memory name

    // Plain paths and file:// are local; s3://, gs://, az:// and memory:// are
    // the others. Any other scheme is reported through error.
    static std::optional<DestinationAddress> parse(const std::string& address, std::string& error);
};

const char* to_string(DestinationAddress::Scheme scheme);

// Turns a destination address into a sink. Scheme dispatch happens here and
// nowhere else.
class SinkFactory {
public:
    struct Settings {
        uint64_t part_size = 8 * 1024 * 1024;

        std::string s3_region = "us-east-1";
        std::string s3_endpoint;
        std::string s3_access_key;
        std::string s3_secret_key;
        std::string s3_session_token;

        std::string gcs_token;

        std::string azure_account;
        std::string azure_account_key; // base64; Shared Key, preferred over the SAS token
        std::string azure_sas_token;
        std::string azure_endpoint;

        static Settings from_config();
    };

    SinkFactory(network::HttpClient& http, Settings settings);

    transfer::TransferResult create(const std::string& address,
                                    std::unique_ptr<DestinationSink>& sink) const;

private:
    network::HttpClient& http_;
    Settings settings_;
    std::unique_ptr<network::TokenProvider> gcs_tokens_;
};

} // namespace chunkrelay::storage

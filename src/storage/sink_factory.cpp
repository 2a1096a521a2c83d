#include "chunkrelay/storage/sink_factory.hpp"
#include "chunkrelay/storage/azure_blob_sink.hpp"
#include "chunkrelay/storage/gcs_sink.hpp"
#include "chunkrelay/storage/local_file_sink.hpp"
#include "chunkrelay/storage/memory_sink.hpp"
#include "chunkrelay/storage/s3_sink.hpp"
#include "chunkrelay/core/config.hpp"
#include "chunkrelay/core/logger.hpp"
#include "chunkrelay/core/utils.hpp"

namespace chunkrelay::storage {

using transfer::TransferResult;
using chunkrelay::core::utils::FileUtils;
using chunkrelay::core::utils::StringUtils;

const char* to_string(DestinationAddress::Scheme scheme) {
    switch (scheme) {
        case DestinationAddress::Scheme::LOCAL: return "local";
        case DestinationAddress::Scheme::S3: return "s3";
        case DestinationAddress::Scheme::GCS: return "gcs";
        case DestinationAddress::Scheme::AZURE: return "azure";
        case DestinationAddress::Scheme::MEMORY: return "memory";
    }
    return "unknown";
}

std::optional<DestinationAddress> DestinationAddress::parse(const std::string& address, std::string& error) {
    DestinationAddress result;

    auto separator = address.find("://");
    if (separator == std::string::npos) {
        if (address.empty()) {
            error = "Empty destination";
            return std::nullopt;
        }
        result.scheme = Scheme::LOCAL;
        result.path = address;
        return result;
    }

    auto scheme = StringUtils::to_lower(address.substr(0, separator));
    auto rest = address.substr(separator + 3);

    if (scheme == "file") {
        result.scheme = Scheme::LOCAL;
        result.path = rest;
    } else if (scheme == "memory") {
        result.scheme = Scheme::MEMORY;
        result.path = rest;
        return result;
    } else if (scheme == "s3" || scheme == "gs" || scheme == "gcs" || scheme == "az" || scheme == "azure") {
        result.scheme = (scheme == "s3") ? Scheme::S3
                      : (scheme == "az" || scheme == "azure") ? Scheme::AZURE
                      : Scheme::GCS;

        auto slash = rest.find('/');
        if (slash == std::string::npos || slash == 0 || slash + 1 >= rest.size()) {
            error = "Destination " + address + " needs both a bucket and an object name";
            return std::nullopt;
        }
        result.bucket = rest.substr(0, slash);
        result.path = rest.substr(slash + 1);
    } else {
        error = "Unsupported destination scheme '" + scheme + "'";
        return std::nullopt;
    }

    if (result.path.empty()) {
        error = "Destination " + address + " has no path";
        return std::nullopt;
    }
    return result;
}

SinkFactory::Settings SinkFactory::Settings::from_config() {
    auto& config = core::Config::instance();
    Settings settings;

    settings.part_size = config.get_uint64("upload.part_size", settings.part_size);
    settings.s3_region = config.get_string("s3.region", settings.s3_region);
    settings.s3_endpoint = config.get_string("s3.endpoint");
    settings.s3_access_key = config.get_string("s3.access_key");
    settings.s3_secret_key = config.get_string("s3.secret_key");
    settings.s3_session_token = config.get_string("s3.session_token");
    settings.gcs_token = config.get_string("gcs.token");
    settings.azure_account = config.get_string("azure.account_name");
    settings.azure_account_key = config.get_string("azure.account_key");
    settings.azure_sas_token = config.get_string("azure.sas_token");
    settings.azure_endpoint = config.get_string("azure.endpoint");

    return settings;
}

SinkFactory::SinkFactory(network::HttpClient& http, Settings settings)
    : http_(http)
    , settings_(std::move(settings))
    , gcs_tokens_(std::make_unique<network::StaticTokenProvider>(settings_.gcs_token))
{
}

TransferResult SinkFactory::create(const std::string& address,
                                   std::unique_ptr<DestinationSink>& sink) const {
    std::string error;
    auto parsed = DestinationAddress::parse(address, error);
    if (!parsed) {
        return TransferResult::permanent(error);
    }

    switch (parsed->scheme) {
        case DestinationAddress::Scheme::LOCAL:
            sink = std::make_unique<LocalFileSink>(FileUtils::expand_user(parsed->path));
            break;

        case DestinationAddress::Scheme::MEMORY:
            sink = std::make_unique<MemorySink>(address);
            break;

        case DestinationAddress::Scheme::S3: {
            if (settings_.s3_access_key.empty() || settings_.s3_secret_key.empty()) {
                return TransferResult::permanent("S3 destination needs s3.access_key and s3.secret_key");
            }
            S3Credentials credentials;
            credentials.access_key = settings_.s3_access_key;
            credentials.secret_key.assign(settings_.s3_secret_key);
            credentials.session_token = settings_.s3_session_token;

            S3Sink::Options options;
            options.region = settings_.s3_region;
            options.endpoint = settings_.s3_endpoint;
            options.part_size = settings_.part_size;

            sink = std::make_unique<S3Sink>(http_, parsed->bucket, parsed->path, std::move(credentials), options);
            break;
        }

        case DestinationAddress::Scheme::GCS: {
            if (settings_.gcs_token.empty()) {
                return TransferResult::permanent("GCS destination needs gcs.token");
            }
            GcsSink::Options options;
            options.part_size = settings_.part_size;
            sink = std::make_unique<GcsSink>(http_, *gcs_tokens_, parsed->bucket, parsed->path, options);
            break;
        }

        case DestinationAddress::Scheme::AZURE: {
            if (settings_.azure_account.empty() && settings_.azure_endpoint.empty()) {
                return TransferResult::permanent("Azure destination needs azure.account_name");
            }
            AzureCredentials credentials;
            if (!settings_.azure_account_key.empty()) {
                if (settings_.azure_account.empty()) {
                    return TransferResult::permanent("azure.account_key needs azure.account_name");
                }
                credentials.shared_key = AzureSharedKeySigner::from_account_key(settings_.azure_account,
                                                                                settings_.azure_account_key);
                if (!credentials.shared_key) {
                    return TransferResult::permanent("azure.account_key is not valid base64");
                }
            } else {
                credentials.sas_token = settings_.azure_sas_token;
            }

            AzureBlobSink::Options options;
            options.endpoint = settings_.azure_endpoint;
            options.part_size = settings_.part_size;
            sink = std::make_unique<AzureBlobSink>(http_, settings_.azure_account, parsed->bucket,
                                                   parsed->path, std::move(credentials), options);
            break;
        }
    }

    LOG_DEBUG("Destination {} -> {} sink", address, to_string(parsed->scheme));
    return TransferResult::ok();
}

} // namespace chunkrelay::storage

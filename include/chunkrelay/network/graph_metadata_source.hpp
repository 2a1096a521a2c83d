#pragma once

#include "http_client.hpp"
#include "token_provider.hpp"
#include "../transfer/metadata_source.hpp"
#include "../transfer/retry_policy.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunkrelay::network {

struct DriveItem {
    std::string name;
    bool is_folder = false;
    uint64_t size = 0;
    std::string id;
    std::string last_modified;
    std::string web_url;
};

// Drive items of one SharePoint site, through Microsoft Graph.
// Object ids are paths relative to the site's default document library.
class GraphMetadataSource : public transfer::MetadataSource {
public:
    static constexpr const char* DEFAULT_BASE_URL = "https://graph.microsoft.com/v1.0";

    GraphMetadataSource(HttpClient& http,
                        TokenProvider& tokens,
                        std::string hostname,
                        std::string site_path,
                        std::string base_url = DEFAULT_BASE_URL,
                        transfer::RetryPolicy::Options retry =
                            transfer::RetryPolicy::Options::for_class(transfer::OperationClass::METADATA));

    // Single attempt; the session applies the metadata retry budget.
    transfer::TransferResult resolve_size(const std::string& object_id,
                                          std::optional<uint64_t>& size,
                                          std::stop_token stop) override;

    // The following retry on their own with the metadata budget.
    transfer::TransferResult site_id(std::string& id, std::stop_token stop);
    transfer::TransferResult content_url(const std::string& file_path, std::string& url, std::stop_token stop);
    transfer::TransferResult list(const std::string& folder, std::vector<DriveItem>& items, std::stop_token stop);

    static std::string normalize_path(const std::string& path);
    static std::optional<DriveItem> parse_item(const std::string& json);

private:
    HttpClient& http_;
    TokenProvider& tokens_;
    std::string hostname_;
    std::string site_path_;
    std::string base_url_;
    transfer::RetryPolicy retry_;

    std::mutex site_mutex_;
    std::optional<std::string> site_id_;

    transfer::TransferResult lookup_site_id(std::string& id, std::stop_token stop);
    transfer::TransferResult get_json(const std::string& url, std::string& body, std::stop_token stop);
    transfer::TransferResult with_retry(const std::string& what,
                                        std::stop_token stop,
                                        const std::function<transfer::TransferResult()>& op);
    std::string item_url(const std::string& site, const std::string& path) const;
};

} // namespace chunkrelay::network

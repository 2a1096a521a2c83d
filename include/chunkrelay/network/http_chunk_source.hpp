#pragma once

#include "http_client.hpp"
#include "token_provider.hpp"
#include "../transfer/chunk_source.hpp"
#include "../transfer/metadata_source.hpp"
#include <optional>
#include <string>

namespace chunkrelay::network {

struct ContentRange {
    uint64_t first = 0;
    uint64_t last = 0;
    std::optional<uint64_t> total;
    bool unsatisfied = false; // "bytes */total"
};

// Parses "bytes a-b/total", "bytes a-b/*" and "bytes */total".
std::optional<ContentRange> parse_content_range(const std::string& value);

// Reads byte ranges of one URL with HTTP Range requests. A null token
// provider means the URL is pre-authenticated.
class HttpChunkSource : public transfer::ChunkSource {
public:
    HttpChunkSource(HttpClient& http, std::string url, TokenProvider* tokens = nullptr);

    transfer::TransferResult fetch(uint64_t offset,
                                   uint64_t length,
                                   transfer::FetchResponse& response,
                                   std::stop_token stop) override;

    const std::string& url() const { return url_; }

private:
    HttpClient& http_;
    std::string url_;
    TokenProvider* tokens_;
};

// Size from a HEAD request's Content-Length. Unknown when the server omits it.
class HeadMetadataSource : public transfer::MetadataSource {
public:
    explicit HeadMetadataSource(HttpClient& http, TokenProvider* tokens = nullptr);

    // object_id is the URL.
    transfer::TransferResult resolve_size(const std::string& object_id,
                                          std::optional<uint64_t>& size,
                                          std::stop_token stop) override;

private:
    HttpClient& http_;
    TokenProvider* tokens_;
};

} // namespace chunkrelay::network

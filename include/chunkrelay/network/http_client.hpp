#pragma once

#include "../transfer/transfer_types.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace chunkrelay::network {

enum class HttpMethod {
    GET,
    HEAD,
    PUT,
    POST,
    DELETE
};

const char* to_string(HttpMethod method);

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;

    // Not owned; must outlive the call to perform().
    std::span<const uint8_t> body;

    // Overrides the client's default request timeout.
    std::optional<std::chrono::milliseconds> timeout;

    // The transfer is aborted once the response body grows past this.
    std::optional<uint64_t> max_body_bytes;

    void add_header(std::string name, std::string value) {
        headers.emplace_back(std::move(name), std::move(value));
    }
};

struct HttpResponse {
    long status = 0;

    // Header names are lowercased.
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    bool transport_ok = false;
    bool timed_out = false;
    bool cancelled = false;
    bool body_limit_exceeded = false;
    std::string transport_error;

    std::optional<std::string> header(const std::string& name) const;
    std::string body_text() const { return std::string(body.begin(), body.end()); }
    bool is_success() const { return transport_ok && status >= 200 && status < 300; }
};

// Blocking HTTP transport. Implementations must be safe to call from several
// threads at once and must give up promptly once stop is requested.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse perform(const HttpRequest& request, std::stop_token stop) = 0;
};

// Parses a Retry-After value: delta-seconds (fractions allowed) or an HTTP-date.
std::optional<std::chrono::milliseconds> parse_retry_after(
    const std::string& value,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// Maps a response onto the error taxonomy:
//   429, or 503 carrying Retry-After    -> RATE_LIMITED (with hint when given)
//   transport failure, 408, other 5xx   -> TRANSIENT
//   any other non-2xx                   -> PERMANENT
transfer::TransferResult classify_response(const HttpResponse& response, const std::string& context);

inline std::span<const uint8_t> as_bytes(const std::string& text) {
    return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

} // namespace chunkrelay::network

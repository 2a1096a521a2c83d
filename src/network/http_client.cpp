#include "chunkrelay/network/http_client.hpp"
#include "chunkrelay/core/utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace chunkrelay::network {

using transfer::TransferResult;
using chunkrelay::core::utils::StringUtils;
using chunkrelay::core::utils::TimeUtils;

const char* to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::POST: return "POST";
        case HttpMethod::DELETE: return "DELETE";
    }
    return "GET";
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    auto it = headers.find(StringUtils::to_lower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::chrono::milliseconds> parse_retry_after(const std::string& value,
                                                           std::chrono::system_clock::time_point now) {
    auto text = StringUtils::trim(value);
    if (text.empty()) {
        return std::nullopt;
    }

    char* end = nullptr;
    double seconds = std::strtod(text.c_str(), &end);
    if (end != text.c_str() && *end == '\0') {
        if (!std::isfinite(seconds) || seconds < 0) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(static_cast<int64_t>(std::ceil(seconds * 1000.0)));
    }

    auto date = TimeUtils::from_http_date(text);
    if (!date) {
        return std::nullopt;
    }

    auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(*date - now);
    return std::max(delta, std::chrono::milliseconds(0));
}

TransferResult classify_response(const HttpResponse& response, const std::string& context) {
    if (response.cancelled) {
        return TransferResult::cancelled(context + ": request cancelled");
    }

    if (!response.transport_ok) {
        return TransferResult::transient(context + ": " +
                                         (response.timed_out ? "timed out" : response.transport_error));
    }

    auto status = response.status;
    if (status >= 200 && status < 300) {
        return TransferResult::ok();
    }

    std::string what = context + ": HTTP " + std::to_string(status);

    auto retry_after = response.header("retry-after");
    std::optional<std::chrono::milliseconds> hint;
    if (retry_after) {
        hint = parse_retry_after(*retry_after);
    }

    if (status == 429 || (status == 503 && hint)) {
        return TransferResult::rate_limited(what + " (throttled)", hint);
    }

    if (status == 408 || status >= 500) {
        return TransferResult::transient(what);
    }

    if (status == 401 || status == 403) {
        return TransferResult::permanent(what + " (authentication failed)");
    }

    if (status == 404) {
        return TransferResult::permanent(what + " (not found)");
    }

    auto body = response.body_text();
    if (body.size() > 256) {
        body.resize(256);
    }
    return TransferResult::permanent(body.empty() ? what : what + ": " + body);
}

} // namespace chunkrelay::network

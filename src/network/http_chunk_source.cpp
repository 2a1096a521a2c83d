#include "chunkrelay/network/http_chunk_source.hpp"
#include "chunkrelay/core/logger.hpp"
#include "chunkrelay/core/utils.hpp"
#include <charconv>

namespace chunkrelay::network {

using transfer::TransferResult;
using chunkrelay::core::utils::StringUtils;

namespace {

std::optional<uint64_t> parse_u64(const std::string& text) {
    uint64_t value = 0;
    auto trimmed = StringUtils::trim(text);
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    if (ec != std::errc() || ptr != trimmed.data() + trimmed.size() || trimmed.empty()) {
        return std::nullopt;
    }
    return value;
}

TransferResult authorize(HttpRequest& request, TokenProvider* tokens, std::stop_token stop) {
    if (!tokens) {
        return TransferResult::ok();
    }

    std::string token;
    auto result = tokens->get_token(token, stop);
    if (!result) {
        return result;
    }

    request.add_header("Authorization", "Bearer " + token);
    return TransferResult::ok();
}

}

std::optional<ContentRange> parse_content_range(const std::string& value) {
    auto text = StringUtils::trim(value);
    if (!StringUtils::starts_with(StringUtils::to_lower(text), "bytes ")) {
        return std::nullopt;
    }
    text = StringUtils::trim(text.substr(6));

    auto slash = text.find('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }

    ContentRange range;
    auto span_part = text.substr(0, slash);
    auto total_part = text.substr(slash + 1);

    if (total_part != "*") {
        range.total = parse_u64(total_part);
        if (!range.total) return std::nullopt;
    }

    if (span_part == "*") {
        if (!range.total) return std::nullopt;
        range.unsatisfied = true;
        return range;
    }

    auto dash = span_part.find('-');
    if (dash == std::string::npos) {
        return std::nullopt;
    }

    auto first = parse_u64(span_part.substr(0, dash));
    auto last = parse_u64(span_part.substr(dash + 1));
    if (!first || !last || *last < *first) {
        return std::nullopt;
    }

    range.first = *first;
    range.last = *last;
    return range;
}

HttpChunkSource::HttpChunkSource(HttpClient& http, std::string url, TokenProvider* tokens)
    : http_(http)
    , url_(std::move(url))
    , tokens_(tokens)
{
}

TransferResult HttpChunkSource::fetch(uint64_t offset,
                                      uint64_t length,
                                      transfer::FetchResponse& out,
                                      std::stop_token stop) {
    if (length == 0) {
        return TransferResult::permanent("Zero-length range requested");
    }

    HttpRequest request;
    request.url = url_;
    request.add_header("Range", "bytes=" + std::to_string(offset) + "-" +
                                std::to_string(offset + length - 1));
    request.max_body_bytes = length;

    auto auth = authorize(request, tokens_, stop);
    if (!auth) {
        return auth;
    }

    auto response = http_.perform(request, stop);
    std::string what = "Range " + std::to_string(offset) + "+" + std::to_string(length);

    if (!response.transport_ok) {
        return classify_response(response, what);
    }

    switch (response.status) {
        case 206: {
            auto header = response.header("content-range");
            auto range = header ? parse_content_range(*header) : std::nullopt;
            if (!range || range->unsatisfied) {
                return TransferResult::permanent(what + ": missing or malformed Content-Range");
            }
            if (range->first != offset) {
                return TransferResult::permanent(what + ": server answered from offset " +
                                                 std::to_string(range->first));
            }
            if (response.body.size() != range->last - range->first + 1) {
                // Connection dropped mid-body; the same range can be asked for again.
                return TransferResult::transient(what + ": short body (" +
                                                 std::to_string(response.body.size()) + " bytes)");
            }

            out.data = std::move(response.body);
            out.object_size = range->total;
            out.end_of_object = range->total && range->last + 1 >= *range->total;
            return TransferResult::ok();
        }

        case 200: {
            // Range ignored. Acceptable only when the whole object fits the first chunk.
            if (offset != 0 || response.body_limit_exceeded) {
                return TransferResult::permanent(what + ": server does not honour Range requests");
            }
            LOG_DEBUG("Server ignored Range for {}; whole object is {} bytes", what, response.body.size());
            out.object_size = response.body.size();
            out.data = std::move(response.body);
            out.end_of_object = true;
            return TransferResult::ok();
        }

        case 416: {
            auto header = response.header("content-range");
            auto range = header ? parse_content_range(*header) : std::nullopt;
            if (range && range->total && offset < *range->total) {
                return TransferResult::permanent(what + ": range not satisfiable within " +
                                                 std::to_string(*range->total) + " bytes");
            }
            // Asked at or past the end: the object is complete.
            out.data.clear();
            out.object_size = (range && range->total) ? range->total : std::optional<uint64_t>(offset);
            out.end_of_object = true;
            return TransferResult::ok();
        }

        default:
            return classify_response(response, what);
    }
}

HeadMetadataSource::HeadMetadataSource(HttpClient& http, TokenProvider* tokens)
    : http_(http)
    , tokens_(tokens)
{
}

TransferResult HeadMetadataSource::resolve_size(const std::string& object_id,
                                                std::optional<uint64_t>& size,
                                                std::stop_token stop) {
    HttpRequest request;
    request.method = HttpMethod::HEAD;
    request.url = object_id;

    auto auth = authorize(request, tokens_, stop);
    if (!auth) {
        return auth;
    }

    auto response = http_.perform(request, stop);

    // Some servers refuse HEAD outright; the size is then learned from the first range.
    if (response.transport_ok && (response.status == 405 || response.status == 501)) {
        size.reset();
        return TransferResult::ok();
    }

    auto result = classify_response(response, "HEAD");
    if (!result) {
        return result;
    }

    auto length = response.header("content-length");
    size = length ? parse_u64(*length) : std::nullopt;
    return TransferResult::ok();
}

} // namespace chunkrelay::network

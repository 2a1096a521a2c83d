#include "chunkrelay/network/graph_metadata_source.hpp"
#include "chunkrelay/transfer/retry_runner.hpp"
#include "chunkrelay/core/logger.hpp"
#include "chunkrelay/core/utils.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <sstream>

namespace chunkrelay::network {

using transfer::TransferResult;
using chunkrelay::core::utils::StringUtils;
using chunkrelay::core::utils::UrlUtils;
namespace pt = boost::property_tree;

namespace {

TransferResult parse_json(const std::string& body, pt::ptree& json) {
    try {
        std::istringstream stream(body);
        pt::read_json(stream, json);
    } catch (const pt::json_parser_error& e) {
        return TransferResult::permanent(std::string("Malformed Graph response: ") + e.what());
    }
    return TransferResult::ok();
}

DriveItem item_from_tree(const pt::ptree& node) {
    DriveItem item;
    item.name = node.get<std::string>("name", "");
    item.is_folder = static_cast<bool>(node.get_child_optional("folder"));
    item.size = node.get<uint64_t>("size", 0);
    item.id = node.get<std::string>("id", "");
    item.last_modified = node.get<std::string>("lastModifiedDateTime", "");
    item.web_url = node.get<std::string>("webUrl", "");
    return item;
}

}

GraphMetadataSource::GraphMetadataSource(HttpClient& http,
                                         TokenProvider& tokens,
                                         std::string hostname,
                                         std::string site_path,
                                         std::string base_url,
                                         transfer::RetryPolicy::Options retry)
    : http_(http)
    , tokens_(tokens)
    , hostname_(std::move(hostname))
    , site_path_(std::move(site_path))
    , base_url_(std::move(base_url))
    , retry_(retry)
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string GraphMetadataSource::normalize_path(const std::string& path) {
    auto parts = StringUtils::split(path, '/');
    std::vector<std::string> kept;
    for (const auto& part : parts) {
        if (!part.empty()) {
            kept.push_back(part);
        }
    }
    return StringUtils::join(kept, "/");
}

std::optional<DriveItem> GraphMetadataSource::parse_item(const std::string& json) {
    pt::ptree tree;
    if (!parse_json(json, tree)) {
        return std::nullopt;
    }
    return item_from_tree(tree);
}

TransferResult GraphMetadataSource::resolve_size(const std::string& object_id,
                                                 std::optional<uint64_t>& size,
                                                 std::stop_token stop) {
    std::string site;
    auto result = lookup_site_id(site, stop);
    if (!result) {
        return result;
    }

    std::string body;
    result = get_json(item_url(site, object_id), body, stop);
    if (!result) {
        return result;
    }

    pt::ptree tree;
    result = parse_json(body, tree);
    if (!result) {
        return result;
    }

    if (tree.get_child_optional("folder")) {
        return TransferResult::permanent(object_id + " is a folder");
    }

    const auto size_node = tree.get_optional<uint64_t>("size");
    size = size_node ? std::optional<uint64_t>(*size_node) : std::nullopt;
    return TransferResult::ok();
}

TransferResult GraphMetadataSource::site_id(std::string& id, std::stop_token stop) {
    return with_retry("Site lookup", stop, [&] { return lookup_site_id(id, stop); });
}

TransferResult GraphMetadataSource::content_url(const std::string& file_path,
                                                std::string& url,
                                                std::stop_token stop) {
    std::string site;
    auto result = site_id(site, stop);
    if (!result) {
        return result;
    }

    url = item_url(site, file_path) + ":/content";
    return TransferResult::ok();
}

TransferResult GraphMetadataSource::list(const std::string& folder,
                                         std::vector<DriveItem>& items,
                                         std::stop_token stop) {
    std::string site;
    auto result = site_id(site, stop);
    if (!result) {
        return result;
    }

    auto path = normalize_path(folder);
    std::string url = path.empty()
        ? base_url_ + "/sites/" + site + "/drive/root/children"
        : item_url(site, path) + ":/children";

    items.clear();
    size_t pages = 0;

    // Each page gets its own retry budget; pages already read are kept.
    while (!url.empty()) {
        std::string body;
        result = with_retry("Listing " + (path.empty() ? std::string("/") : path), stop,
                            [&] { return get_json(url, body, stop); });
        if (!result) {
            return result;
        }

        pt::ptree tree;
        result = parse_json(body, tree);
        if (!result) {
            return result;
        }

        if (auto values = tree.get_child_optional("value")) {
            for (const auto& [key, node] : *values) {
                items.push_back(item_from_tree(node));
            }
        }

        url = tree.get<std::string>("@odata.nextLink", "");
        ++pages;
    }

    LOG_DEBUG("Listed {} item(s) under /{} in {} page(s)", items.size(), path, pages);
    return TransferResult::ok();
}

TransferResult GraphMetadataSource::lookup_site_id(std::string& id, std::stop_token stop) {
    {
        std::lock_guard<std::mutex> lock(site_mutex_);
        if (site_id_) {
            id = *site_id_;
            return TransferResult::ok();
        }
    }

    auto path = normalize_path(site_path_);
    std::string url = base_url_ + "/sites/" + hostname_ + ":/" + UrlUtils::encode(path, true);

    std::string body;
    auto result = get_json(url, body, stop);
    if (!result) {
        return result;
    }

    pt::ptree tree;
    result = parse_json(body, tree);
    if (!result) {
        return result;
    }

    auto found = tree.get<std::string>("id", "");
    if (found.empty()) {
        return TransferResult::permanent("Site " + hostname_ + "/" + path + " has no id");
    }

    LOG_DEBUG("Resolved site {}/{} to {}", hostname_, path, found);

    std::lock_guard<std::mutex> lock(site_mutex_);
    site_id_ = found;
    id = found;
    return TransferResult::ok();
}

TransferResult GraphMetadataSource::get_json(const std::string& url, std::string& body, std::stop_token stop) {
    std::string token;
    auto result = tokens_.get_token(token, stop);
    if (!result) {
        return result;
    }

    HttpRequest request;
    request.url = url;
    request.add_header("Authorization", "Bearer " + token);
    request.add_header("Accept", "application/json");

    auto response = http_.perform(request, stop);
    result = classify_response(response, "Graph GET");
    if (!result) {
        return result;
    }

    body = response.body_text();
    return TransferResult::ok();
}

TransferResult GraphMetadataSource::with_retry(const std::string& what,
                                               std::stop_token stop,
                                               const std::function<TransferResult()>& op) {
    transfer::RetryContext context;
    return transfer::run_with_retry(retry_, context, stop, op,
        [&](const TransferResult& error, const transfer::RetryContext& ctx, std::chrono::milliseconds delay) {
            LOG_WARN("{} failed ({}), attempt {}/{}; retrying in {} ms", what, error.describe(),
                     ctx.attempts, retry_.options().max_attempts, delay.count());
        });
}

std::string GraphMetadataSource::item_url(const std::string& site, const std::string& path) const {
    return base_url_ + "/sites/" + site + "/drive/root:/" + UrlUtils::encode(normalize_path(path), true);
}

} // namespace chunkrelay::network
